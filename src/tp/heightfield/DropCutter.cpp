// DropCutter.cpp lowers the tool onto the mesh at every grid point and keeps the first touch.
// The bucket grid limits each sample to the triangles near its XY, and the max-Z ordering inside a
// bucket lets a sample stop once no remaining triangle reaches above the current contact.

#include "tp/heightfield/DropCutter.h"

#include "tp/TriangleGrid.h"

#include "common/ScopedTimer.h"
#include "common/log.h"

#include <QtCore/QString>

#include <algorithm>
#include <cmath>
#include <limits>

namespace tp::heightfield
{

namespace
{

constexpr double kNoContact = -std::numeric_limits<double>::infinity();
constexpr double kVerticalFaceEps = 1e-10;
constexpr double kBallFaceNormalSq = 1e-8;
constexpr double kDegenerateEdgeSq = 1e-20;
constexpr int kProgressRowInterval = 10;

// Tool shape reduced to what the contact tests need.
struct Profile
{
    ToolKind kind{ToolKind::FlatEnd};
    double radius{0.0};
    double radiusSq{0.0};
    double tanHalf{0.0};

    explicit Profile(const ToolConfig& tool)
        : kind(tool.kind)
        , radius(tool.radius())
        , radiusSq(tool.radius() * tool.radius())
        , tanHalf(tool.tanHalfAngle())
    {
    }

    // Tip Z for a feature at featureZ, horizontal squared distance dSq from the axis.
    // The flat bottom reaches its rim; the ball and V profiles stop short of it.
    [[nodiscard]] double tipZ(double featureZ, double dSq) const
    {
        switch (kind)
        {
        case ToolKind::FlatEnd:
            return dSq <= radiusSq ? featureZ : kNoContact;
        case ToolKind::BallNose:
            return dSq < radiusSq ? featureZ - radius + std::sqrt(radiusSq - dSq) : kNoContact;
        case ToolKind::VBit:
            if (dSq >= radiusSq || tanHalf <= 0.0)
            {
                return kNoContact;
            }
            return featureZ - std::sqrt(dSq) / tanHalf;
        }
        return kNoContact;
    }
};

double planeZAt(double x, double y, const Triangle& tri)
{
    const glm::dvec3 e1 = tri.v1 - tri.v0;
    const glm::dvec3 e2 = tri.v2 - tri.v0;
    const double nz = e1.x * e2.y - e1.y * e2.x;
    if (std::abs(nz) < kVerticalFaceEps)
    {
        return kNoContact;
    }
    const double nx = e1.y * e2.z - e1.z * e2.y;
    const double ny = e1.z * e2.x - e1.x * e2.z;
    return tri.v0.z + (-nx * (x - tri.v0.x) - ny * (y - tri.v0.y)) / nz;
}

// Rejects faces within about 0.006 degrees of vertical before reading the plane.
double ballFaceZ(double x, double y, const Triangle& tri)
{
    const glm::dvec3 e1 = tri.v1 - tri.v0;
    const glm::dvec3 e2 = tri.v2 - tri.v0;
    const double nx = e1.y * e2.z - e1.z * e2.y;
    const double ny = e1.z * e2.x - e1.x * e2.z;
    const double nz = e1.x * e2.y - e1.y * e2.x;
    if (std::abs(nz) <= kVerticalFaceEps)
    {
        return kNoContact;
    }
    const double lenSq = nx * nx + ny * ny + nz * nz;
    if ((nz * nz) / lenSq <= kBallFaceNormalSq)
    {
        return kNoContact;
    }
    return tri.v0.z + (-nx * (x - tri.v0.x) - ny * (y - tri.v0.y)) / nz;
}

double edgeContact(double x, double y, const glm::dvec3& a, const glm::dvec3& b, const Profile& profile)
{
    const double edx = b.x - a.x;
    const double edy = b.y - a.y;
    const double lenSq = edx * edx + edy * edy;
    double t = 0.0;
    if (lenSq > kDegenerateEdgeSq)
    {
        t = std::clamp(((x - a.x) * edx + (y - a.y) * edy) / lenSq, 0.0, 1.0);
    }
    const double dx = a.x + t * edx - x;
    const double dy = a.y + t * edy - y;
    return profile.tipZ(a.z + t * (b.z - a.z), dx * dx + dy * dy);
}

double vertexContact(double x, double y, const glm::dvec3& v, const Profile& profile)
{
    const double dx = v.x - x;
    const double dy = v.y - y;
    return profile.tipZ(v.z, dx * dx + dy * dy);
}

double dropOnTriangle(double x, double y, const Triangle& tri, const Profile& profile)
{
    double best = kNoContact;
    if (isPointInTriangleXY(x, y, tri))
    {
        best = (profile.kind == ToolKind::BallNose) ? ballFaceZ(x, y, tri) : planeZAt(x, y, tri);
    }

    best = std::max(best, edgeContact(x, y, tri.v0, tri.v1, profile));
    best = std::max(best, edgeContact(x, y, tri.v1, tri.v2, profile));
    best = std::max(best, edgeContact(x, y, tri.v2, tri.v0, profile));

    best = std::max(best, vertexContact(x, y, tri.v0, profile));
    best = std::max(best, vertexContact(x, y, tri.v1, profile));
    best = std::max(best, vertexContact(x, y, tri.v2, profile));
    return best;
}

} // namespace

bool isPointInTriangleXY(double x, double y, const Triangle& tri)
{
    const glm::dvec3& a = tri.v0;
    const glm::dvec3& b = tri.v1;
    const glm::dvec3& c = tri.v2;
    const double d1 = (x - b.x) * (a.y - b.y) - (a.x - b.x) * (y - b.y);
    const double d2 = (x - c.x) * (b.y - c.y) - (b.x - c.x) * (y - c.y);
    const double d3 = (x - a.x) * (c.y - a.y) - (c.x - a.x) * (y - a.y);
    const bool hasNeg = d1 < 0.0 || d2 < 0.0 || d3 < 0.0;
    const bool hasPos = d1 > 0.0 || d2 > 0.0 || d3 > 0.0;
    return !(hasNeg && hasPos);
}

double dropCutterOnTriangle(double x, double y, const Triangle& tri, const ToolConfig& tool)
{
    return dropOnTriangle(x, y, tri, Profile(tool));
}

HeightMap computeHeightMap(const std::vector<Triangle>& triangles,
                           const ZMapConfig& config,
                           const ToolConfig& tool,
                           const std::function<void(int)>& progressCallback)
{
    common::ScopedTimer timer(QStringLiteral("Height map %1x%2").arg(config.gridWidth).arg(config.gridHeight));
    HeightMap heightMap(config);
    if (triangles.empty())
    {
        LOG_WARN(Mesh, "Height map requested for an empty mesh");
        return heightMap;
    }

    const Profile profile(tool);
    const TriangleGrid grid(triangles, config.physicalWidth_mm, config.physicalHeight_mm, profile.radius);
    const TriangleGrid::BuildStats& gridStats = grid.stats();
    LOG_INFO(Mesh, QStringLiteral("Bucket grid %1x%2 (cell %3 mm): %4 triangles registered, %5 outside stock, "
                                  "%6 entries, largest bucket %7")
                       .arg(grid.cellsX())
                       .arg(grid.cellsY())
                       .arg(grid.cellSize(), 0, 'f', 3)
                       .arg(gridStats.registered)
                       .arg(gridStats.dropped)
                       .arg(gridStats.entries)
                       .arg(gridStats.largestBucket));

    std::size_t contactSamples = 0;
    for (int gy = 0; gy < config.gridHeight; ++gy)
    {
        const double y = config.yAt(gy);
        for (int gx = 0; gx < config.gridWidth; ++gx)
        {
            const double x = config.xAt(gx);
            double best = kNoContact;
            for (const std::uint32_t index : grid.bucketAt(x, y))
            {
                // Buckets are sorted by descending max Z, and no contact lies above it.
                if (grid.maxZ(index) <= best)
                {
                    break;
                }
                best = std::max(best, dropOnTriangle(x, y, grid.triangle(index), profile));
            }
            if (best != kNoContact)
            {
                ++contactSamples;
                heightMap.set(gx, gy, best);
            }
        }

        if (progressCallback && gy % kProgressRowInterval == 0)
        {
            progressCallback(static_cast<int>(100.0 * gy / config.gridHeight));
        }
    }

    const double coverage = config.sampleCount() > 0
                                ? 100.0 * static_cast<double>(contactSamples) / static_cast<double>(config.sampleCount())
                                : 0.0;
    LOG_INFO(Mesh, QStringLiteral("Height map sampled %1 points, %2% in contact")
                       .arg(config.sampleCount())
                       .arg(coverage, 0, 'f', 1));
    return heightMap;
}

HeightMap computeHeightMap(const std::vector<float>& vertices,
                           const ZMapConfig& config,
                           const ToolConfig& tool,
                           const std::function<void(int)>& progressCallback)
{
    const std::vector<Triangle> triangles = meshFromFlatVertices(vertices);
    return computeHeightMap(triangles, config, tool, progressCallback);
}

} // namespace tp::heightfield
