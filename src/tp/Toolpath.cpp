#include "tp/Toolpath.h"

namespace tp
{

std::size_t ToolPath::pointCount() const noexcept
{
    std::size_t count = 0;
    for (const ToolPathSegment& segment : segments)
    {
        count += segment.points.size();
    }
    return count;
}

ToolPathStats measureToolPath(const ToolPath& path, double feedRate, double plungeRate)
{
    ToolPathStats stats;
    bool havePrevious = false;
    geom::Point3D previous{0.0};
    for (const ToolPathSegment& segment : path.segments)
    {
        for (const geom::Point3D& point : segment.points)
        {
            if (!havePrevious)
            {
                previous = point;
                havePrevious = true;
                continue;
            }

            const double dist = geom::distance3D(previous, point);
            previous = point;
            stats.totalDistance_mm += dist;
            switch (segment.kind)
            {
            case MoveKind::Cut:
                stats.cuttingDistance_mm += dist;
                stats.estimatedTime_min += dist / feedRate;
                break;
            case MoveKind::Plunge:
                stats.estimatedTime_min += dist / plungeRate;
                break;
            case MoveKind::Rapid:
            case MoveKind::Retract:
                stats.rapidDistance_mm += dist;
                stats.estimatedTime_min += dist / kNominalRapidRate_mm_min;
                break;
            }
        }
    }
    return stats;
}

std::vector<float> toFlatBuffer(const ToolPath& path)
{
    std::vector<float> buffer;
    buffer.reserve(path.pointCount() * 4);
    for (const ToolPathSegment& segment : path.segments)
    {
        const auto code = static_cast<float>(static_cast<int>(segment.kind));
        for (const geom::Point3D& point : segment.points)
        {
            buffer.push_back(static_cast<float>(point.x));
            buffer.push_back(static_cast<float>(point.y));
            buffer.push_back(static_cast<float>(point.z));
            buffer.push_back(code);
        }
    }
    return buffer;
}

} // namespace tp
