#pragma once

#include "geom/Primitives.h"

#include <vector>

namespace tp
{

// Rapid travel from home (0, 0) through the paths in order: home to the first start, then
// every end to the next start.
[[nodiscard]] double travelDistance(const std::vector<geom::Polyline>& polylines);

// Greedy nearest neighbour from home, refined by bounded 2-opt for more than three paths.
// Open polylines may be reversed, closed ones never. The returned order never travels
// further than the input order.
[[nodiscard]] std::vector<geom::Polyline> optimizePathOrder(const std::vector<geom::Polyline>& polylines);

} // namespace tp
