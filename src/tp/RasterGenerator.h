#pragma once

#include "tp/Toolpath.h"
#include "tp/heightfield/HeightMap.h"

#include <functional>

namespace tp
{

struct RasterParams
{
    double stepover_mm{1.0};
    double safeZ_mm{5.0};
    double feedRate_mm_min{800.0};
    double plungeRate_mm_min{300.0};
};

// Zigzag sweep along X over every n-th grid row, n = max(1, round(stepover / cell size)).
// Rows are linked by cutting moves; the tool only leaves the surface after the last row.
// Progress receives 100 * rowsDone / rows every 10 rows.
[[nodiscard]] ToolPath generateRasterPaths(const heightfield::HeightMap& heightMap,
                                           const RasterParams& params,
                                           const std::function<void(int)>& progressCallback = {});

} // namespace tp
