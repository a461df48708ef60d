#pragma once

#include "tp/MeshInput.h"
#include "tp/Tool.h"
#include "tp/heightfield/HeightMap.h"

#include <functional>
#include <vector>

namespace tp::heightfield
{

// Highest tip Z at which the tool axis through (x, y) touches the triangle, from the face
// under the axis, the three edges and the three vertices. -infinity when out of reach.
[[nodiscard]] double dropCutterOnTriangle(double x, double y, const Triangle& tri, const ToolConfig& tool);

// Sign test; points on an edge count as inside.
[[nodiscard]] bool isPointInTriangleXY(double x, double y, const Triangle& tri);

// Samples every grid point against the triangles of its bucket. Progress receives
// 100 * row / rows every 10 rows.
[[nodiscard]] HeightMap computeHeightMap(const std::vector<Triangle>& triangles,
                                         const ZMapConfig& config,
                                         const ToolConfig& tool,
                                         const std::function<void(int)>& progressCallback = {});

// Flat buffer form, 9 floats per triangle. Throws MeshInputError on a malformed buffer.
[[nodiscard]] HeightMap computeHeightMap(const std::vector<float>& vertices,
                                         const ZMapConfig& config,
                                         const ToolConfig& tool,
                                         const std::function<void(int)>& progressCallback = {});

} // namespace tp::heightfield
