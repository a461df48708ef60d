#include "tp/Stock.h"

#include <algorithm>

namespace tp
{

namespace
{
constexpr double kMinDimension = 0.001;
}

void StockConfig::ensureValid()
{
    width_mm = std::max(width_mm, kMinDimension);
    height_mm = std::max(height_mm, kMinDimension);
    thickness_mm = std::max(thickness_mm, 0.0);
}

StockConfig makeDefaultStock()
{
    StockConfig stock;
    stock.ensureValid();
    return stock;
}

} // namespace tp
