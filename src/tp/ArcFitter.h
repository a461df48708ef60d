#pragma once

#include "geom/Primitives.h"

#include <optional>
#include <vector>

namespace tp
{

struct Circle
{
    geom::Point2D center{0.0};
    double radius{0.0};
};

// Circumscribed circle of three XY points; nullopt when they are (nearly) collinear.
[[nodiscard]] std::optional<Circle> fitCircle(const geom::Point2D& a, const geom::Point2D& b, const geom::Point2D& c);

struct FittedMove
{
    enum class Kind
    {
        Linear,
        Arc
    };

    Kind kind{Kind::Linear};
    geom::Point3D end{0.0};   // target point; arcs keep the start Z
    geom::Point2D start{0.0}; // arcs only
    double centerI{0.0};      // arc center minus start
    double centerJ{0.0};
    bool clockwise{false};
};

struct ArcFitOptions
{
    double tolerance{0.01};
    int minArcPoints{4};
    double maxRadius{1000.0};
};

// Replaces runs of same-Z points lying on one circle by arc moves. Every point not covered by
// an arc becomes a linear move; an arc's start point is the point before its first interior
// point, so the caller must already be there (or move there) before the arc.
[[nodiscard]] std::vector<FittedMove> detectArcs(const std::vector<geom::Point3D>& points,
                                                 const ArcFitOptions& options = {});

// Removes points whose perpendicular distance from the line through their kept predecessor
// and their successor is within tolerance and that lie between the two.
[[nodiscard]] std::vector<geom::Point3D> simplifyCollinear(const std::vector<geom::Point3D>& points,
                                                           double tolerance = 0.001);

} // namespace tp
