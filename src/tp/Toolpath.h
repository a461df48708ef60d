#pragma once

#include "geom/Primitives.h"

#include <vector>

namespace tp
{

// Values double as the kind code of the visualization buffer.
enum class MoveKind
{
    Rapid = 0,
    Cut = 1,
    Plunge = 2,
    Retract = 3
};

constexpr double kNominalRapidRate_mm_min = 5'000.0;

struct ToolPathSegment
{
    MoveKind kind{MoveKind::Cut};
    std::vector<geom::Point3D> points;
};

struct ToolPathStats
{
    double totalDistance_mm{0.0};
    double cuttingDistance_mm{0.0};
    double rapidDistance_mm{0.0};
    double estimatedTime_min{0.0};
    // Sampled grid of mesh runs, zero for vector runs.
    int gridWidth{0};
    int gridHeight{0};
};

struct ToolPath
{
    std::vector<ToolPathSegment> segments;
    ToolPathStats stats;

    [[nodiscard]] bool empty() const noexcept { return segments.empty(); }
    [[nodiscard]] std::size_t pointCount() const noexcept;
};

// Stats of a path whose segments chain end to start: each point is reached from its
// predecessor (the previous segment's last point for a segment's first point).
[[nodiscard]] ToolPathStats measureToolPath(const ToolPath& path, double feedRate, double plungeRate);

// Four floats per point: x, y, z, MoveKind code.
[[nodiscard]] std::vector<float> toFlatBuffer(const ToolPath& path);

} // namespace tp
