#include "tp/Tool.h"

#include "tp/ConfigError.h"

#include "geom/Primitives.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tp
{

namespace
{
constexpr double kMinDiameter = 0.01;
constexpr double kMinRate = 1.0;
constexpr double kMinAngle = 1.0;
constexpr double kMaxAngle = 179.0;

bool validVAngle(double angleDeg)
{
    return angleDeg > 0.0 && angleDeg < 180.0;
}
} // namespace

double ToolConfig::tanHalfAngle() const
{
    if (!validVAngle(angle_deg))
    {
        return 0.0;
    }
    return std::tan(geom::degToRad(angle_deg * 0.5));
}

void ToolConfig::ensureValid()
{
    diameter_mm = std::max(diameter_mm, kMinDiameter);
    angle_deg = std::clamp(angle_deg, kMinAngle, kMaxAngle);
    spindle_rpm = std::max(spindle_rpm, 0.0);
    feedRate_mm_min = std::max(feedRate_mm_min, kMinRate);
    plungeRate_mm_min = std::max(plungeRate_mm_min, kMinRate);
}

ToolConfig makeDefaultTool()
{
    ToolConfig tool;
    tool.ensureValid();
    return tool;
}

QString toolKindName(ToolKind kind)
{
    switch (kind)
    {
    case ToolKind::FlatEnd: return QStringLiteral("flat_end");
    case ToolKind::BallNose: return QStringLiteral("ball_nose");
    case ToolKind::VBit: return QStringLiteral("v_bit");
    }
    return QStringLiteral("unknown");
}

ToolKind parseToolKind(const QString& name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("flat_end"))
    {
        return ToolKind::FlatEnd;
    }
    if (key == QLatin1String("ball_nose"))
    {
        return ToolKind::BallNose;
    }
    if (key == QLatin1String("v_bit"))
    {
        return ToolKind::VBit;
    }
    throw ConfigError(QStringLiteral("unknown tool type '%1'").arg(name).toStdString());
}

double toolContactOffset(const ToolConfig& tool, double d)
{
    const double r = tool.radius();
    d = std::abs(d);
    if (d > r)
    {
        return -std::numeric_limits<double>::infinity();
    }

    switch (tool.kind)
    {
    case ToolKind::FlatEnd:
        return 0.0;
    case ToolKind::BallNose:
        return -r + std::sqrt(r * r - d * d);
    case ToolKind::VBit: {
        const double tanHalf = tool.tanHalfAngle();
        if (tanHalf <= 0.0)
        {
            return -std::numeric_limits<double>::infinity();
        }
        return -d / tanHalf;
    }
    }
    return -std::numeric_limits<double>::infinity();
}

double vBitDepthForWidth(double width, double angleDeg)
{
    if (!validVAngle(angleDeg))
    {
        return 0.0;
    }
    return width / (2.0 * std::tan(geom::degToRad(angleDeg * 0.5)));
}

double vBitWidthAtDepth(double depth, double angleDeg)
{
    if (!validVAngle(angleDeg))
    {
        return 0.0;
    }
    return 2.0 * std::abs(depth) * std::tan(geom::degToRad(angleDeg * 0.5));
}

} // namespace tp
