#pragma once

#include "geom/Primitives.h"

#include <stdexcept>
#include <vector>

namespace tp
{

class MeshInputError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct Triangle
{
    geom::Point3D v0{0.0};
    geom::Point3D v1{0.0};
    geom::Point3D v2{0.0};
};

struct MeshBounds
{
    geom::Point3D min{0.0};
    geom::Point3D max{0.0};
    bool valid{false};
};

// Nine floats per triangle (x0 y0 z0 x1 y1 z1 x2 y2 z2). A trailing partial triangle or a
// non-finite coordinate throws MeshInputError naming the triangle.
[[nodiscard]] std::vector<Triangle> meshFromFlatVertices(const std::vector<float>& vertices);

[[nodiscard]] MeshBounds computeMeshBounds(const std::vector<Triangle>& triangles);

} // namespace tp
