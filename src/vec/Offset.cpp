#include "vec/Offset.h"

#include "common/log.h"

#include <glm/geometric.hpp>

#include <cmath>

namespace vec
{

namespace
{

constexpr double kClosingTolerance = 0.001;
constexpr double kBisectorMinLength = 1e-4;

std::vector<geom::Point2D> edgeNormals(const std::vector<geom::Point2D>& points, bool wrap)
{
    const std::size_t count = wrap ? points.size() : points.size() - 1;
    std::vector<geom::Point2D> normals;
    normals.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        const geom::Point2D edge = points[(i + 1) % points.size()] - points[i];
        const double len = glm::length(edge);
        normals.push_back(len > 0.0 ? geom::Point2D(-edge.y / len, edge.x / len) : geom::Point2D(0.0));
    }
    return normals;
}

geom::Point2D miterPoint(const geom::Point2D& vertex,
                         const geom::Point2D& nPrev,
                         const geom::Point2D& nNext,
                         double offset)
{
    const geom::Point2D sum = nPrev + nNext;
    const double len = glm::length(sum);
    const geom::Point2D bisector = len < kBisectorMinLength ? nPrev : sum / len;
    const double dot = glm::dot(nPrev, bisector);
    const double miterLength = dot != 0.0 ? offset / dot : offset;
    return vertex + bisector * miterLength;
}

geom::Polyline offsetClosed(const geom::Polyline& polyline, double offset)
{
    std::vector<geom::Point2D> pts = polyline.points;
    if (pts.size() < 3)
    {
        return polyline;
    }
    const geom::Point2D& first = pts.front();
    const geom::Point2D& last = pts.back();
    if (std::abs(first.x - last.x) < kClosingTolerance && std::abs(first.y - last.y) < kClosingTolerance)
    {
        pts.pop_back();
    }
    if (pts.size() < 3)
    {
        return polyline;
    }

    const std::vector<geom::Point2D> normals = edgeNormals(pts, true);
    geom::Polyline result;
    result.closed = true;
    result.points.reserve(pts.size() + 1);
    for (std::size_t i = 0; i < pts.size(); ++i)
    {
        const std::size_t prev = (i + pts.size() - 1) % pts.size();
        result.points.push_back(miterPoint(pts[i], normals[prev], normals[i], offset));
    }
    result.points.push_back(result.points.front());
    return result;
}

geom::Polyline offsetOpen(const geom::Polyline& polyline, double offset)
{
    const auto& pts = polyline.points;
    const std::vector<geom::Point2D> normals = edgeNormals(pts, false);

    geom::Polyline result;
    result.closed = false;
    result.points.reserve(pts.size());
    result.points.push_back(pts.front() + normals.front() * offset);
    for (std::size_t i = 1; i + 1 < pts.size(); ++i)
    {
        result.points.push_back(miterPoint(pts[i], normals[i - 1], normals[i], offset));
    }
    result.points.push_back(pts.back() + normals.back() * offset);
    return result;
}

} // namespace

geom::Polyline offsetPolyline(const geom::Polyline& polyline, double offset)
{
    if (offset == 0.0 || polyline.points.size() < 2)
    {
        return polyline;
    }
    return polyline.closed ? offsetClosed(polyline, offset) : offsetOpen(polyline, offset);
}

std::vector<geom::Polyline> offsetForTool(const std::vector<geom::Polyline>& polylines, double toolRadius)
{
    if (toolRadius == 0.0)
    {
        return polylines;
    }

    std::vector<geom::Polyline> result;
    result.reserve(polylines.size());
    for (const geom::Polyline& polyline : polylines)
    {
        result.push_back(offsetPolyline(polyline, toolRadius));
    }
    LOG_INFO(Vec, QStringLiteral("Offset %1 polylines by %2 mm").arg(result.size()).arg(toolRadius, 0, 'f', 3));
    return result;
}

} // namespace vec
