#pragma once

#include "geom/Primitives.h"

#include <vector>

namespace vec
{

struct DiscretizeOptions
{
    double maxSegmentLength{1.0};
    double simplifyEpsilon{0.05};
    double deduplicateTolerance{0.001};
};

// Drops consecutive points that lie within tolerance of the last kept point.
[[nodiscard]] geom::Polyline deduplicatePoints(const geom::Polyline& polyline, double tolerance = 0.001);

// Douglas-Peucker on perpendicular distance; first and last points are always kept.
[[nodiscard]] geom::Polyline simplifyPolyline(const geom::Polyline& polyline, double epsilon = 0.05);

// Splits every segment longer than maxSegmentLength into ceil(len / max) equal parts.
[[nodiscard]] geom::Polyline subdividePolyline(const geom::Polyline& polyline, double maxSegmentLength = 1.0);

// dedupe -> drop degenerate -> simplify -> subdivide.
[[nodiscard]] std::vector<geom::Polyline> processPolylines(const std::vector<geom::Polyline>& polylines,
                                                           const DiscretizeOptions& options = {});

} // namespace vec
