#pragma once

#include "geom/Primitives.h"

#include <vector>

namespace vec
{

// Offsets a polyline along its left-hand edge normals with mitered corners.
// Positive offsets move a counter-clockwise closed contour outward. A zero offset, a
// polyline with fewer than two points, or a closed polyline with fewer than three distinct
// corners is returned unchanged. Self-intersections are not resolved.
[[nodiscard]] geom::Polyline offsetPolyline(const geom::Polyline& polyline, double offset);

[[nodiscard]] std::vector<geom::Polyline> offsetForTool(const std::vector<geom::Polyline>& polylines,
                                                        double toolRadius);

} // namespace vec
