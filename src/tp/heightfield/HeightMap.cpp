#include "tp/heightfield/HeightMap.h"

#include "tp/ConfigError.h"
#include "tp/Stock.h"

#include "common/Enforce.h"

#include <QtCore/QString>

#include <algorithm>
#include <cmath>

namespace tp::heightfield
{

double ZMapConfig::cellSizeX() const noexcept
{
    return gridWidth > 1 ? physicalWidth_mm / (gridWidth - 1) : 0.0;
}

double ZMapConfig::cellSizeY() const noexcept
{
    return gridHeight > 1 ? physicalHeight_mm / (gridHeight - 1) : 0.0;
}

std::size_t ZMapConfig::sampleCount() const noexcept
{
    return static_cast<std::size_t>(std::max(gridWidth, 0)) * static_cast<std::size_t>(std::max(gridHeight, 0));
}

ZMapConfig makeZMapConfig(const StockConfig& stock, double resolution)
{
    if (!(resolution > 0.0) || !std::isfinite(resolution))
    {
        throw ConfigError(QStringLiteral("resolution must be positive, got %1").arg(resolution).toStdString());
    }

    ZMapConfig config;
    config.resolution_mm = resolution;
    config.physicalWidth_mm = stock.width_mm;
    config.physicalHeight_mm = stock.height_mm;
    config.gridWidth = std::max(2, static_cast<int>(std::ceil(stock.width_mm / resolution)));
    config.gridHeight = std::max(2, static_cast<int>(std::ceil(stock.height_mm / resolution)));
    return config;
}

HeightMap::HeightMap(const ZMapConfig& config)
    : m_config(config)
    , m_data(config.sampleCount(), 0.0)
{
    CARVEKIT_ENFORCE(config.gridWidth >= 2 && config.gridHeight >= 2, "height map needs at least 2x2 samples");
}

HeightMap invertHeightMap(const HeightMap& heightMap)
{
    HeightMap inverted(heightMap.config());
    const ZMapConfig& config = heightMap.config();
    for (int gy = 0; gy < config.gridHeight; ++gy)
    {
        for (int gx = 0; gx < config.gridWidth; ++gx)
        {
            const double z = heightMap.at(gx, gy);
            inverted.set(gx, gy, z == 0.0 ? 0.0 : -z);
        }
    }
    return inverted;
}

} // namespace tp::heightfield
