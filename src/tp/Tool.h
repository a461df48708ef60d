#pragma once

#include <QtCore/QString>

namespace tp
{

enum class ToolKind
{
    FlatEnd,
    BallNose,
    VBit
};

struct ToolConfig
{
    ToolKind kind{ToolKind::FlatEnd};
    double diameter_mm{3.175};
    double angle_deg{60.0}; // full included angle, V-bits only
    double spindle_rpm{12'000.0};
    double feedRate_mm_min{800.0};
    double plungeRate_mm_min{300.0};

    [[nodiscard]] double radius() const noexcept { return diameter_mm * 0.5; }
    // Tangent of the V half angle; zero when the angle is outside (0, 180).
    [[nodiscard]] double tanHalfAngle() const;

    void ensureValid();
};

ToolConfig makeDefaultTool();

[[nodiscard]] QString toolKindName(ToolKind kind);
// Accepts "flat_end", "ball_nose", "v_bit"; throws ConfigError for anything else.
[[nodiscard]] ToolKind parseToolKind(const QString& name);

// Height of the cutting profile above the tip at horizontal distance d from the axis:
// flat 0, ball -r + sqrt(r^2 - d^2), V -d / tan(half angle). Outside the radius the tool
// does not reach and the result is -infinity.
[[nodiscard]] double toolContactOffset(const ToolConfig& tool, double d);

[[nodiscard]] double vBitDepthForWidth(double width, double angleDeg);
[[nodiscard]] double vBitWidthAtDepth(double depth, double angleDeg);

} // namespace tp
