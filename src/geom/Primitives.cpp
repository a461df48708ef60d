#include "geom/Primitives.h"

#include <glm/geometric.hpp>

#include <algorithm>
#include <numbers>

namespace geom
{

double distance2D(const Point2D& a, const Point2D& b)
{
    return glm::length(b - a);
}

double distance3D(const Point3D& a, const Point3D& b)
{
    return glm::length(b - a);
}

double lerp(double a, double b, double t)
{
    return a + (b - a) * t;
}

Point2D lerp(const Point2D& a, const Point2D& b, double t)
{
    return a + (b - a) * t;
}

Point3D lerp(const Point3D& a, const Point3D& b, double t)
{
    return a + (b - a) * t;
}

double clamp(double value, double lo, double hi)
{
    return std::min(std::max(value, lo), hi);
}

double degToRad(double degrees)
{
    return degrees * std::numbers::pi / 180.0;
}

double radToDeg(double radians)
{
    return radians * 180.0 / std::numbers::pi;
}

double polylineLength(const std::vector<Point2D>& points)
{
    double length = 0.0;
    for (std::size_t i = 1; i < points.size(); ++i)
    {
        length += distance2D(points[i - 1], points[i]);
    }
    return length;
}

double polyline3DLength(const std::vector<Point3D>& points)
{
    double length = 0.0;
    for (std::size_t i = 1; i < points.size(); ++i)
    {
        length += distance3D(points[i - 1], points[i]);
    }
    return length;
}

Bounds2D computeBounds(const std::vector<Polyline>& polylines)
{
    Bounds2D bounds;
    for (const Polyline& polyline : polylines)
    {
        for (const Point2D& p : polyline.points)
        {
            if (!bounds.valid)
            {
                bounds.min = p;
                bounds.max = p;
                bounds.valid = true;
                continue;
            }
            bounds.min = glm::min(bounds.min, p);
            bounds.max = glm::max(bounds.max, p);
        }
    }
    return bounds;
}

Polyline reversePolyline(const Polyline& polyline)
{
    Polyline reversed;
    reversed.closed = polyline.closed;
    reversed.points.assign(polyline.points.rbegin(), polyline.points.rend());
    return reversed;
}

} // namespace geom
