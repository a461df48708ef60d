#pragma once

#include "geom/AffineTransform.h"
#include "geom/Primitives.h"

#include <vector>

namespace vec
{

constexpr double kDefaultFlatness = 0.5;

// The flatteners work in local (untransformed) coordinates. They append the points after
// p0, each mapped through the transform; p0 itself is expected to be in the output already.

void flattenCubic(const geom::Point2D& p0,
                  const geom::Point2D& p1,
                  const geom::Point2D& p2,
                  const geom::Point2D& p3,
                  const geom::AffineTransform& transform,
                  std::vector<geom::Point2D>& out,
                  double tolerance = kDefaultFlatness);

void flattenQuadratic(const geom::Point2D& p0,
                      const geom::Point2D& control,
                      const geom::Point2D& p2,
                      const geom::AffineTransform& transform,
                      std::vector<geom::Point2D>& out,
                      double tolerance = kDefaultFlatness);

// Elliptical arc in endpoint parameterization. Radii too small to span the endpoints are
// scaled up; a zero radius degrades to a straight line.
void flattenArc(const geom::Point2D& start,
                double rx,
                double ry,
                double rotationDeg,
                bool largeArc,
                bool sweep,
                const geom::Point2D& end,
                const geom::AffineTransform& transform,
                std::vector<geom::Point2D>& out);

} // namespace vec
