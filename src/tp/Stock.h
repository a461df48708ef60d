#pragma once

namespace tp
{

struct StockConfig
{
    double width_mm{200.0};
    double height_mm{200.0};
    double thickness_mm{10.0};

    void ensureValid();
};

StockConfig makeDefaultStock();

} // namespace tp
