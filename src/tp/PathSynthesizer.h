#pragma once

#include "tp/Toolpath.h"

#include "geom/Primitives.h"

#include <vector>

namespace tp
{

struct SynthesisParams
{
    double cutDepth_mm{1.0}; // positive depth below Z0
    double safeZ_mm{5.0};
    double feedRate_mm_min{800.0};
    double plungeRate_mm_min{300.0};
};

// Turns ordered 2D contours into rapid / plunge / cut / retract segments at a single depth.
// Entries ramp along the contour at about 3 degrees when it is long enough, otherwise they
// plunge vertically.
[[nodiscard]] ToolPath synthesizeToolpath(const std::vector<geom::Polyline>& polylines,
                                          const SynthesisParams& params);

} // namespace tp
