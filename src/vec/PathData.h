#pragma once

#include "geom/AffineTransform.h"
#include "geom/Primitives.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace vec
{

class PathDataError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Reads path data ("M 0 0 L 10 0 C ...") into polylines mapped through the transform.
// Curves are flattened with the CurveFlattener defaults. Every subpath with at least two
// points becomes one polyline; "Z" closes it with an explicit duplicate of its start.
// Throws PathDataError on an unknown command, a missing or non-finite number, or a number
// in command position.
[[nodiscard]] std::vector<geom::Polyline> parsePathData(
    const std::string& data,
    const geom::AffineTransform& transform = geom::AffineTransform::identity());

} // namespace vec
