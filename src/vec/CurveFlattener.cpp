#include "vec/CurveFlattener.h"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace vec
{

namespace
{

constexpr int kMaxBezierDepth = 12;
constexpr double kArcStep = std::numbers::pi / 16.0;
constexpr int kMinArcSamples = 4;

void flattenCubicRecursive(const geom::Point2D& p0,
                           const geom::Point2D& p1,
                           const geom::Point2D& p2,
                           const geom::Point2D& p3,
                           const geom::AffineTransform& transform,
                           std::vector<geom::Point2D>& out,
                           double tolerance,
                           int depth)
{
    if (depth > kMaxBezierDepth)
    {
        out.push_back(transform.apply(p3));
        return;
    }

    const double dx = p3.x - p0.x;
    const double dy = p3.y - p0.y;
    const double d2 = std::abs((p1.x - p3.x) * dy - (p1.y - p3.y) * dx);
    const double d3 = std::abs((p2.x - p3.x) * dy - (p2.y - p3.y) * dx);
    const double lenSq = dx * dx + dy * dy;
    if ((d2 + d3) * (d2 + d3) <= tolerance * tolerance * lenSq)
    {
        out.push_back(transform.apply(p3));
        return;
    }

    const geom::Point2D m01 = (p0 + p1) * 0.5;
    const geom::Point2D m12 = (p1 + p2) * 0.5;
    const geom::Point2D m23 = (p2 + p3) * 0.5;
    const geom::Point2D m012 = (m01 + m12) * 0.5;
    const geom::Point2D m123 = (m12 + m23) * 0.5;
    const geom::Point2D mid = (m012 + m123) * 0.5;

    flattenCubicRecursive(p0, m01, m012, mid, transform, out, tolerance, depth + 1);
    flattenCubicRecursive(mid, m123, m23, p3, transform, out, tolerance, depth + 1);
}

} // namespace

void flattenCubic(const geom::Point2D& p0,
                  const geom::Point2D& p1,
                  const geom::Point2D& p2,
                  const geom::Point2D& p3,
                  const geom::AffineTransform& transform,
                  std::vector<geom::Point2D>& out,
                  double tolerance)
{
    flattenCubicRecursive(p0, p1, p2, p3, transform, out, tolerance, 0);
}

void flattenQuadratic(const geom::Point2D& p0,
                      const geom::Point2D& control,
                      const geom::Point2D& p2,
                      const geom::AffineTransform& transform,
                      std::vector<geom::Point2D>& out,
                      double tolerance)
{
    const geom::Point2D c1 = p0 + (control - p0) * (2.0 / 3.0);
    const geom::Point2D c2 = p2 + (control - p2) * (2.0 / 3.0);
    flattenCubic(p0, c1, c2, p2, transform, out, tolerance);
}

void flattenArc(const geom::Point2D& start,
                double rx,
                double ry,
                double rotationDeg,
                bool largeArc,
                bool sweep,
                const geom::Point2D& end,
                const geom::AffineTransform& transform,
                std::vector<geom::Point2D>& out)
{
    if (rx == 0.0 || ry == 0.0)
    {
        out.push_back(transform.apply(end));
        return;
    }

    rx = std::abs(rx);
    ry = std::abs(ry);
    const double phi = geom::degToRad(rotationDeg);
    const double cosPhi = std::cos(phi);
    const double sinPhi = std::sin(phi);

    const double hx = (start.x - end.x) * 0.5;
    const double hy = (start.y - end.y) * 0.5;
    const double x1p = cosPhi * hx + sinPhi * hy;
    const double y1p = -sinPhi * hx + cosPhi * hy;
    const double x1pSq = x1p * x1p;
    const double y1pSq = y1p * y1p;

    const double lambda = x1pSq / (rx * rx) + y1pSq / (ry * ry);
    if (lambda > 1.0)
    {
        const double s = std::sqrt(lambda);
        rx *= s;
        ry *= s;
    }
    const double rxSq = rx * rx;
    const double rySq = ry * ry;

    const double denom = rxSq * y1pSq + rySq * x1pSq;
    double coef = denom > 0.0 ? std::sqrt(std::max(0.0, (rxSq * rySq - rxSq * y1pSq - rySq * x1pSq) / denom))
                              : 0.0;
    if (largeArc == sweep)
    {
        coef = -coef;
    }

    const double cxp = coef * (rx * y1p) / ry;
    const double cyp = -coef * (ry * x1p) / rx;
    const double cx = cosPhi * cxp - sinPhi * cyp + (start.x + end.x) * 0.5;
    const double cy = sinPhi * cxp + cosPhi * cyp + (start.y + end.y) * 0.5;

    const double theta1 = std::atan2((y1p - cyp) / ry, (x1p - cxp) / rx);
    double dtheta = std::atan2((-y1p - cyp) / ry, (-x1p - cxp) / rx) - theta1;
    if (sweep && dtheta < 0.0)
    {
        dtheta += 2.0 * std::numbers::pi;
    }
    if (!sweep && dtheta > 0.0)
    {
        dtheta -= 2.0 * std::numbers::pi;
    }

    const int segments = std::max(kMinArcSamples, static_cast<int>(std::ceil(std::abs(dtheta) / kArcStep)));
    for (int i = 1; i <= segments; ++i)
    {
        const double t = theta1 + dtheta * static_cast<double>(i) / segments;
        const double xr = rx * std::cos(t);
        const double yr = ry * std::sin(t);
        out.push_back(transform.apply({cosPhi * xr - sinPhi * yr + cx, sinPhi * xr + cosPhi * yr + cy}));
    }
}

} // namespace vec
