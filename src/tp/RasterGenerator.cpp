#include "tp/RasterGenerator.h"

#include "common/log.h"

#include <QtCore/QString>

#include <algorithm>
#include <cmath>

namespace tp
{

namespace
{
constexpr int kProgressRowInterval = 10;
}

ToolPath generateRasterPaths(const heightfield::HeightMap& heightMap,
                             const RasterParams& params,
                             const std::function<void(int)>& progressCallback)
{
    const heightfield::ZMapConfig& config = heightMap.config();
    ToolPath path;
    path.stats.gridWidth = config.gridWidth;
    path.stats.gridHeight = config.gridHeight;

    const double cellSizeX = config.cellSizeX();
    const int rowSpacing = cellSizeX > 0.0
                               ? std::max(1, static_cast<int>(std::lround(params.stepover_mm / cellSizeX)))
                               : 1;

    std::vector<int> rows;
    for (int gy = 0; gy < config.gridHeight; gy += rowSpacing)
    {
        rows.push_back(gy);
    }
    const int totalRows = static_cast<int>(rows.size());

    for (int rowIdx = 0; rowIdx < totalRows; ++rowIdx)
    {
        const int gy = rows[static_cast<std::size_t>(rowIdx)];
        const bool forward = (rowIdx % 2) == 0;
        const double y = config.yAt(gy);

        std::vector<geom::Point3D> rowPoints;
        rowPoints.reserve(static_cast<std::size_t>(config.gridWidth));
        for (int i = 0; i < config.gridWidth; ++i)
        {
            const int gx = forward ? i : config.gridWidth - 1 - i;
            rowPoints.emplace_back(config.xAt(gx), y, heightMap.at(gx, gy));
        }

        if (rowIdx == 0)
        {
            const geom::Point3D& start = rowPoints.front();
            path.segments.push_back({MoveKind::Rapid, {{start.x, start.y, params.safeZ_mm}}});
            path.segments.push_back({MoveKind::Plunge, {start}});
            path.segments.push_back({MoveKind::Cut, std::vector<geom::Point3D>(rowPoints.begin() + 1, rowPoints.end())});
        }
        else
        {
            // Includes the stepover from the previous row end to this row start.
            path.segments.push_back({MoveKind::Cut, std::move(rowPoints)});
        }

        if (progressCallback && (rowIdx + 1) % kProgressRowInterval == 0)
        {
            progressCallback(static_cast<int>(100.0 * (rowIdx + 1) / totalRows));
        }
    }

    if (!path.segments.empty())
    {
        const geom::Point3D end = path.segments.back().points.back();
        path.segments.push_back({MoveKind::Retract, {{end.x, end.y, params.safeZ_mm}}});
    }

    const int gridWidth = path.stats.gridWidth;
    const int gridHeight = path.stats.gridHeight;
    path.stats = measureToolPath(path, params.feedRate_mm_min, params.plungeRate_mm_min);
    path.stats.gridWidth = gridWidth;
    path.stats.gridHeight = gridHeight;

    LOG_INFO(Tp, QStringLiteral("Raster: %1 rows every %2 grid lines, cut %3 mm")
                     .arg(totalRows)
                     .arg(rowSpacing)
                     .arg(path.stats.cuttingDistance_mm, 0, 'f', 2));
    return path;
}

} // namespace tp
