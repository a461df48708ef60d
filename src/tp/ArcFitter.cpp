#include "tp/ArcFitter.h"

#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace tp
{

namespace
{

constexpr double kCollinearDet = 1e-10;
constexpr double kFullCircleGuard = 1e-3;
constexpr double kDegenerateLength = 1e-10;

geom::Point2D xy(const geom::Point3D& p)
{
    return {p.x, p.y};
}

double cross2(const geom::Point2D& a, const geom::Point2D& b)
{
    return a.x * b.y - a.y * b.x;
}

bool onCircle(const geom::Point3D& p, const Circle& circle, double tolerance)
{
    return std::abs(glm::length(xy(p) - circle.center) - circle.radius) <= tolerance;
}

FittedMove linearMove(const geom::Point3D& p)
{
    FittedMove move;
    move.kind = FittedMove::Kind::Linear;
    move.end = p;
    return move;
}

// Signed angle swept from a to b around the center, taken in the arc's winding direction.
double stepAngle(const geom::Point2D& a, const geom::Point2D& b, const geom::Point2D& center, bool clockwise)
{
    const geom::Point2D va = a - center;
    const geom::Point2D vb = b - center;
    double delta = std::atan2(cross2(va, vb), glm::dot(va, vb));
    if (clockwise)
    {
        delta = -delta;
    }
    return delta;
}

// Last index reachable from start while every step keeps turning in the winding direction
// and the total sweep stays short of a full turn.
std::size_t limitSweep(const std::vector<geom::Point3D>& points,
                       std::size_t start,
                       std::size_t end,
                       const Circle& circle,
                       bool clockwise)
{
    double sweep = 0.0;
    for (std::size_t j = start + 1; j <= end; ++j)
    {
        const double delta = stepAngle(xy(points[j - 1]), xy(points[j]), circle.center, clockwise);
        if (delta <= 0.0 || sweep + delta >= 2.0 * std::numbers::pi - kFullCircleGuard)
        {
            return j - 1;
        }
        sweep += delta;
    }
    return end;
}

} // namespace

std::optional<Circle> fitCircle(const geom::Point2D& a, const geom::Point2D& b, const geom::Point2D& c)
{
    const double d = 2.0 * (a.x * (b.y - c.y) + b.x * (c.y - a.y) + c.x * (a.y - b.y));
    if (std::abs(d) < kCollinearDet)
    {
        return std::nullopt;
    }

    const double aSq = a.x * a.x + a.y * a.y;
    const double bSq = b.x * b.x + b.y * b.y;
    const double cSq = c.x * c.x + c.y * c.y;
    Circle circle;
    circle.center.x = (aSq * (b.y - c.y) + bSq * (c.y - a.y) + cSq * (a.y - b.y)) / d;
    circle.center.y = (aSq * (c.x - b.x) + bSq * (a.x - c.x) + cSq * (b.x - a.x)) / d;
    circle.radius = glm::length(a - circle.center);
    return circle;
}

std::vector<FittedMove> detectArcs(const std::vector<geom::Point3D>& points, const ArcFitOptions& options)
{
    std::vector<FittedMove> result;
    const std::size_t n = points.size();
    const std::size_t minPoints = static_cast<std::size_t>(std::max(options.minArcPoints, 3));
    result.reserve(n);
    if (n < 2)
    {
        for (const geom::Point3D& p : points)
        {
            result.push_back(linearMove(p));
        }
        return result;
    }

    std::size_t i = 0;
    while (i < n)
    {
        if (i + minPoints - 1 >= n)
        {
            for (; i < n; ++i)
            {
                result.push_back(linearMove(points[i]));
            }
            break;
        }

        const std::size_t mid = std::min(i + minPoints / 2, n - 2);
        const std::size_t end = std::min(i + minPoints - 1, n - 1);
        const std::optional<Circle> circle = fitCircle(xy(points[i]), xy(points[mid]), xy(points[end]));
        if (!circle || circle->radius > options.maxRadius || circle->radius < options.tolerance)
        {
            result.push_back(linearMove(points[i]));
            ++i;
            continue;
        }

        const double z0 = points[i].z;
        bool sameZ = true;
        for (std::size_t j = i; j <= end; ++j)
        {
            if (std::abs(points[j].z - z0) > options.tolerance)
            {
                sameZ = false;
                break;
            }
        }
        if (!sameZ)
        {
            result.push_back(linearMove(points[i]));
            ++i;
            continue;
        }

        std::size_t arcEnd = end;
        for (std::size_t j = end + 1; j < n; ++j)
        {
            if (std::abs(points[j].z - z0) > options.tolerance || !onCircle(points[j], *circle, options.tolerance))
            {
                break;
            }
            arcEnd = j;
        }

        bool allOnArc = true;
        for (std::size_t j = i + 1; j < arcEnd; ++j)
        {
            if (!onCircle(points[j], *circle, options.tolerance))
            {
                allOnArc = false;
                break;
            }
        }

        const double winding = cross2(xy(points[i + 1]) - xy(points[i]), xy(points[i + 2]) - xy(points[i]));
        const bool clockwise = winding < 0.0;
        if (allOnArc && winding != 0.0)
        {
            arcEnd = limitSweep(points, i, arcEnd, *circle, clockwise);
        }

        if (!allOnArc || winding == 0.0 || arcEnd - i + 1 < minPoints)
        {
            result.push_back(linearMove(points[i]));
            ++i;
            continue;
        }

        FittedMove arc;
        arc.kind = FittedMove::Kind::Arc;
        arc.start = xy(points[i]);
        arc.end = {points[arcEnd].x, points[arcEnd].y, z0};
        arc.centerI = circle->center.x - points[i].x;
        arc.centerJ = circle->center.y - points[i].y;
        arc.clockwise = clockwise;
        result.push_back(arc);
        i = arcEnd + 1;
    }
    return result;
}

std::vector<geom::Point3D> simplifyCollinear(const std::vector<geom::Point3D>& points, double tolerance)
{
    if (points.size() <= 2)
    {
        return points;
    }

    std::vector<geom::Point3D> result;
    result.reserve(points.size());
    result.push_back(points.front());
    for (std::size_t i = 1; i + 1 < points.size(); ++i)
    {
        const geom::Point3D& prev = result.back();
        const geom::Point3D& curr = points[i];
        const geom::Point3D& next = points[i + 1];

        const geom::Point3D line = next - prev;
        const double len = glm::length(line);
        if (len < kDegenerateLength)
        {
            // Out and back to the same spot: the turning point must stay.
            result.push_back(curr);
            continue;
        }

        const geom::Point3D offset = curr - prev;
        const double along = glm::dot(offset, line) / (len * len);
        const double perpendicular = glm::length(glm::cross(offset, line)) / len;
        if (perpendicular > tolerance || along < 0.0 || along > 1.0)
        {
            result.push_back(curr);
        }
    }
    result.push_back(points.back());
    return result;
}

} // namespace tp
