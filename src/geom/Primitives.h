#pragma once

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <vector>

namespace geom
{

using Point2D = glm::dvec2;
using Point3D = glm::dvec3;

// Closed polylines repeat their first point at the end.
struct Polyline
{
    std::vector<Point2D> points;
    bool closed{false};
};

struct Bounds2D
{
    Point2D min{0.0};
    Point2D max{0.0};
    bool valid{false};

    [[nodiscard]] double width() const noexcept { return valid ? max.x - min.x : 0.0; }
    [[nodiscard]] double height() const noexcept { return valid ? max.y - min.y : 0.0; }
};

[[nodiscard]] double distance2D(const Point2D& a, const Point2D& b);
[[nodiscard]] double distance3D(const Point3D& a, const Point3D& b);

[[nodiscard]] double lerp(double a, double b, double t);
[[nodiscard]] Point2D lerp(const Point2D& a, const Point2D& b, double t);
[[nodiscard]] Point3D lerp(const Point3D& a, const Point3D& b, double t);

[[nodiscard]] double clamp(double value, double lo, double hi);
[[nodiscard]] double degToRad(double degrees);
[[nodiscard]] double radToDeg(double radians);

[[nodiscard]] double polylineLength(const std::vector<Point2D>& points);
[[nodiscard]] double polyline3DLength(const std::vector<Point3D>& points);

// Empty input gives an invalid bounds with zero extent.
[[nodiscard]] Bounds2D computeBounds(const std::vector<Polyline>& polylines);

[[nodiscard]] Polyline reversePolyline(const Polyline& polyline);

} // namespace geom
