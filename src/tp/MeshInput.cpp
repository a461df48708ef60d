#include "tp/MeshInput.h"

#include "common/log.h"

#include <glm/common.hpp>

#include <QtCore/QString>

#include <cmath>

namespace tp
{

namespace
{
constexpr std::size_t kFloatsPerTriangle = 9;
}

std::vector<Triangle> meshFromFlatVertices(const std::vector<float>& vertices)
{
    if (vertices.size() % kFloatsPerTriangle != 0)
    {
        throw MeshInputError(QStringLiteral("vertex buffer holds %1 floats, not a multiple of %2 "
                                            "(partial triangle %3)")
                                 .arg(vertices.size())
                                 .arg(kFloatsPerTriangle)
                                 .arg(vertices.size() / kFloatsPerTriangle)
                                 .toStdString());
    }

    const std::size_t count = vertices.size() / kFloatsPerTriangle;
    std::vector<Triangle> triangles;
    triangles.reserve(count);
    for (std::size_t t = 0; t < count; ++t)
    {
        const float* v = vertices.data() + t * kFloatsPerTriangle;
        for (std::size_t k = 0; k < kFloatsPerTriangle; ++k)
        {
            if (!std::isfinite(v[k]))
            {
                throw MeshInputError(QStringLiteral("triangle %1 has a non-finite coordinate").arg(t).toStdString());
            }
        }
        triangles.push_back({{v[0], v[1], v[2]}, {v[3], v[4], v[5]}, {v[6], v[7], v[8]}});
    }

    LOG_INFO(Mesh, QStringLiteral("Loaded %1 triangles").arg(triangles.size()));
    return triangles;
}

MeshBounds computeMeshBounds(const std::vector<Triangle>& triangles)
{
    MeshBounds bounds;
    for (const Triangle& tri : triangles)
    {
        for (const geom::Point3D& v : {tri.v0, tri.v1, tri.v2})
        {
            if (!bounds.valid)
            {
                bounds.min = v;
                bounds.max = v;
                bounds.valid = true;
                continue;
            }
            bounds.min = glm::min(bounds.min, v);
            bounds.max = glm::max(bounds.max, v);
        }
    }
    return bounds;
}

} // namespace tp
