#pragma once

#include <QtCore/QString>

namespace tp
{

struct StockConfig;

enum class OriginPosition
{
    FrontLeft,
    FrontCenter,
    FrontRight,
    Left,
    Center,
    Right,
    BackLeft,
    BackCenter,
    BackRight
};

// X/Y offsets are added to every emitted coordinate; Z is never shifted.
struct MachineConfig
{
    double safeZ_mm{5.0};
    double originX_mm{0.0};
    double originY_mm{0.0};
    OriginPosition origin{OriginPosition::FrontLeft};

    void ensureValid();
};

MachineConfig makeDefaultMachine();

struct OriginOffset
{
    double x{0.0};
    double y{0.0};
};

[[nodiscard]] QString originPositionName(OriginPosition position);
// Throws ConfigError for names outside the nine anchors ("front-left" ... "back-right").
[[nodiscard]] OriginPosition parseOriginPosition(const QString& name);

// left/center/right -> 0, -W/2, -W; front/middle/back -> 0, -H/2, -H.
[[nodiscard]] OriginOffset computeOriginOffsets(OriginPosition position, const StockConfig& stock);

// Sets origin and the derived offsets in one step.
void applyOrigin(MachineConfig& machine, OriginPosition position, const StockConfig& stock);

} // namespace tp
