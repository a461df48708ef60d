#include "tp/Machine.h"

#include "tp/ConfigError.h"
#include "tp/Stock.h"

#include <algorithm>
#include <array>
#include <utility>

namespace tp
{

namespace
{
constexpr double kMinSafeZ = 0.0;

const std::array<std::pair<OriginPosition, const char*>, 9> kOriginNames{{
    {OriginPosition::FrontLeft, "front-left"},
    {OriginPosition::FrontCenter, "front-center"},
    {OriginPosition::FrontRight, "front-right"},
    {OriginPosition::Left, "left"},
    {OriginPosition::Center, "center"},
    {OriginPosition::Right, "right"},
    {OriginPosition::BackLeft, "back-left"},
    {OriginPosition::BackCenter, "back-center"},
    {OriginPosition::BackRight, "back-right"},
}};

// 0 = left/front, 1 = center/middle, 2 = right/back
std::pair<int, int> anchorColumnRow(OriginPosition position)
{
    switch (position)
    {
    case OriginPosition::FrontLeft: return {0, 0};
    case OriginPosition::FrontCenter: return {1, 0};
    case OriginPosition::FrontRight: return {2, 0};
    case OriginPosition::Left: return {0, 1};
    case OriginPosition::Center: return {1, 1};
    case OriginPosition::Right: return {2, 1};
    case OriginPosition::BackLeft: return {0, 2};
    case OriginPosition::BackCenter: return {1, 2};
    case OriginPosition::BackRight: return {2, 2};
    }
    return {0, 0};
}
} // namespace

void MachineConfig::ensureValid()
{
    safeZ_mm = std::max(safeZ_mm, kMinSafeZ);
}

MachineConfig makeDefaultMachine()
{
    MachineConfig machine;
    machine.ensureValid();
    return machine;
}

QString originPositionName(OriginPosition position)
{
    for (const auto& [value, name] : kOriginNames)
    {
        if (value == position)
        {
            return QString::fromLatin1(name);
        }
    }
    return QStringLiteral("front-left");
}

OriginPosition parseOriginPosition(const QString& name)
{
    const QString key = name.trimmed().toLower();
    for (const auto& [value, label] : kOriginNames)
    {
        if (key == QLatin1String(label))
        {
            return value;
        }
    }
    throw ConfigError(QStringLiteral("unknown origin position '%1'").arg(name).toStdString());
}

OriginOffset computeOriginOffsets(OriginPosition position, const StockConfig& stock)
{
    const auto [column, row] = anchorColumnRow(position);
    OriginOffset offset;
    offset.x = -stock.width_mm * 0.5 * column;
    offset.y = -stock.height_mm * 0.5 * row;
    return offset;
}

void applyOrigin(MachineConfig& machine, OriginPosition position, const StockConfig& stock)
{
    const OriginOffset offset = computeOriginOffsets(position, stock);
    machine.origin = position;
    machine.originX_mm = offset.x;
    machine.originY_mm = offset.y;
}

} // namespace tp
