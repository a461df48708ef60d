#include "vec/Discretizer.h"

#include "common/log.h"

#include <cmath>

namespace vec
{

namespace
{

double perpendicularDistance(const geom::Point2D& p, const geom::Point2D& a, const geom::Point2D& b)
{
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double lenSq = dx * dx + dy * dy;
    if (lenSq == 0.0)
    {
        return geom::distance2D(p, a);
    }
    return std::abs(dy * p.x - dx * p.y + b.x * a.y - b.y * a.x) / std::sqrt(lenSq);
}

// Marks the points of [first, last] that survive simplification.
void douglasPeucker(const std::vector<geom::Point2D>& points,
                    std::size_t first,
                    std::size_t last,
                    double epsilon,
                    std::vector<bool>& keep)
{
    if (last <= first + 1)
    {
        return;
    }

    double maxDist = 0.0;
    std::size_t maxIndex = first;
    for (std::size_t i = first + 1; i < last; ++i)
    {
        const double dist = perpendicularDistance(points[i], points[first], points[last]);
        if (dist > maxDist)
        {
            maxDist = dist;
            maxIndex = i;
        }
    }

    if (maxDist > epsilon)
    {
        keep[maxIndex] = true;
        douglasPeucker(points, first, maxIndex, epsilon, keep);
        douglasPeucker(points, maxIndex, last, epsilon, keep);
    }
}

} // namespace

geom::Polyline deduplicatePoints(const geom::Polyline& polyline, double tolerance)
{
    if (polyline.points.size() <= 1)
    {
        return polyline;
    }

    geom::Polyline result;
    result.closed = polyline.closed;
    result.points.reserve(polyline.points.size());
    result.points.push_back(polyline.points.front());
    for (std::size_t i = 1; i < polyline.points.size(); ++i)
    {
        if (geom::distance2D(result.points.back(), polyline.points[i]) > tolerance)
        {
            result.points.push_back(polyline.points[i]);
        }
    }
    return result;
}

geom::Polyline simplifyPolyline(const geom::Polyline& polyline, double epsilon)
{
    const auto& points = polyline.points;
    if (points.size() <= 2)
    {
        return polyline;
    }

    std::vector<bool> keep(points.size(), false);
    keep.front() = true;
    keep.back() = true;
    douglasPeucker(points, 0, points.size() - 1, epsilon, keep);

    geom::Polyline result;
    result.closed = polyline.closed;
    for (std::size_t i = 0; i < points.size(); ++i)
    {
        if (keep[i])
        {
            result.points.push_back(points[i]);
        }
    }
    return result;
}

geom::Polyline subdividePolyline(const geom::Polyline& polyline, double maxSegmentLength)
{
    if (maxSegmentLength <= 0.0 || polyline.points.empty())
    {
        return polyline;
    }

    geom::Polyline result;
    result.closed = polyline.closed;
    result.points.push_back(polyline.points.front());
    for (std::size_t i = 1; i < polyline.points.size(); ++i)
    {
        const geom::Point2D& prev = polyline.points[i - 1];
        const geom::Point2D& curr = polyline.points[i];
        const double dist = geom::distance2D(prev, curr);
        if (dist > maxSegmentLength)
        {
            const int segments = static_cast<int>(std::ceil(dist / maxSegmentLength));
            for (int j = 1; j < segments; ++j)
            {
                result.points.push_back(geom::lerp(prev, curr, static_cast<double>(j) / segments));
            }
        }
        result.points.push_back(curr);
    }
    return result;
}

std::vector<geom::Polyline> processPolylines(const std::vector<geom::Polyline>& polylines,
                                             const DiscretizeOptions& options)
{
    std::vector<geom::Polyline> result;
    result.reserve(polylines.size());
    std::size_t inputPoints = 0;
    std::size_t outputPoints = 0;
    for (const geom::Polyline& polyline : polylines)
    {
        inputPoints += polyline.points.size();
        geom::Polyline cleaned = deduplicatePoints(polyline, options.deduplicateTolerance);
        if (cleaned.points.size() < 2)
        {
            continue;
        }
        cleaned = simplifyPolyline(cleaned, options.simplifyEpsilon);
        cleaned = subdividePolyline(cleaned, options.maxSegmentLength);
        outputPoints += cleaned.points.size();
        result.push_back(std::move(cleaned));
    }

    LOG_INFO(Vec, QStringLiteral("Discretized %1 polylines (%2 -> %3 points), dropped %4 degenerate")
                      .arg(result.size())
                      .arg(inputPoints)
                      .arg(outputPoints)
                      .arg(polylines.size() - result.size()));
    return result;
}

} // namespace vec
