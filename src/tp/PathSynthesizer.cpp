#include "tp/PathSynthesizer.h"

#include "common/log.h"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace tp
{

namespace
{

constexpr double kMinRapidDistance = 0.001;
constexpr double kRampAngleDeg = 3.0;
constexpr double kRampLengthFactor = 3.0;
constexpr std::size_t kRampMinPoints = 3;

struct RampPlan
{
    std::vector<geom::Point3D> points; // (p0, safeZ) ... (rampEnd, -depth)
    std::size_t resumeIndex{0};        // first polyline point beyond the ramp end
    double length_mm{0.0};
};

// Walks the polyline from its start and lays a constant-slope descent over at most
// rampLength of XY travel. Returns an empty plan when the contour is too short.
RampPlan planRamp(const std::vector<geom::Point2D>& pts, double safeZ, double targetZ)
{
    RampPlan plan;
    const double drop = safeZ - targetZ;
    if (pts.size() < kRampMinPoints || drop <= 0.0)
    {
        return plan;
    }

    const double available = geom::polylineLength(pts);
    if (available < kRampLengthFactor * drop)
    {
        return plan;
    }
    const double rampLength = std::min(drop / std::tan(kRampAngleDeg * std::numbers::pi / 180.0), available);

    plan.points.emplace_back(pts.front().x, pts.front().y, safeZ);
    double travelled = 0.0;
    for (std::size_t i = 1; i < pts.size(); ++i)
    {
        const double edge = geom::distance2D(pts[i - 1], pts[i]);
        if (travelled + edge >= rampLength)
        {
            const double t = edge > 0.0 ? (rampLength - travelled) / edge : 1.0;
            const geom::Point2D end = geom::lerp(pts[i - 1], pts[i], t);
            plan.points.emplace_back(end.x, end.y, targetZ);
            // Land exactly on a vertex: resume after it.
            plan.resumeIndex = (t >= 1.0) ? i + 1 : i;
            break;
        }
        travelled += edge;
        const double z = safeZ - drop * (travelled / rampLength);
        plan.points.emplace_back(pts[i].x, pts[i].y, z);
    }
    if (plan.resumeIndex == 0)
    {
        plan.points.back().z = targetZ;
        plan.resumeIndex = pts.size();
    }
    plan.length_mm = geom::polyline3DLength(plan.points);
    return plan;
}

} // namespace

ToolPath synthesizeToolpath(const std::vector<geom::Polyline>& polylines, const SynthesisParams& params)
{
    ToolPath path;
    ToolPathStats& stats = path.stats;
    const double safeZ = params.safeZ_mm;
    const double cutZ = -params.cutDepth_mm;

    geom::Point3D cursor{0.0, 0.0, safeZ};
    int ramps = 0;

    for (const geom::Polyline& polyline : polylines)
    {
        const auto& pts = polyline.points;
        if (pts.empty())
        {
            continue;
        }

        const geom::Point3D above{pts.front().x, pts.front().y, safeZ};
        const double rapid = geom::distance3D(cursor, above);
        if (rapid > kMinRapidDistance)
        {
            path.segments.push_back({MoveKind::Rapid, {cursor, above}});
            stats.rapidDistance_mm += rapid;
            stats.totalDistance_mm += rapid;
            stats.estimatedTime_min += rapid / kNominalRapidRate_mm_min;
        }

        ToolPathSegment cut{MoveKind::Cut, {}};
        RampPlan ramp = planRamp(pts, safeZ, cutZ);
        if (!ramp.points.empty())
        {
            ++ramps;
            cut.points.push_back(ramp.points.back());
            for (std::size_t i = ramp.resumeIndex; i < pts.size(); ++i)
            {
                cut.points.emplace_back(pts[i].x, pts[i].y, cutZ);
            }
            // A closed contour continues around over the ramped stretch to clear it at depth.
            if (polyline.closed)
            {
                const std::size_t coveredEnd = std::min(ramp.resumeIndex, pts.size());
                for (std::size_t i = 1; i < coveredEnd; ++i)
                {
                    cut.points.emplace_back(pts[i].x, pts[i].y, cutZ);
                }
                const geom::Point3D rampEnd = ramp.points.back();
                if (geom::distance3D(cut.points.back(), rampEnd) > 0.0)
                {
                    cut.points.push_back(rampEnd);
                }
            }
            stats.totalDistance_mm += ramp.length_mm;
            stats.estimatedTime_min += ramp.length_mm / params.plungeRate_mm_min;
            path.segments.push_back({MoveKind::Plunge, std::move(ramp.points)});
        }
        else
        {
            const geom::Point3D bottom{pts.front().x, pts.front().y, cutZ};
            const double plunge = geom::distance3D(above, bottom);
            stats.totalDistance_mm += plunge;
            stats.estimatedTime_min += plunge / params.plungeRate_mm_min;
            path.segments.push_back({MoveKind::Plunge, {above, bottom}});
            for (const geom::Point2D& p : pts)
            {
                cut.points.emplace_back(p.x, p.y, cutZ);
            }
        }

        const double cutLength = geom::polyline3DLength(cut.points);
        stats.cuttingDistance_mm += cutLength;
        stats.totalDistance_mm += cutLength;
        stats.estimatedTime_min += cutLength / params.feedRate_mm_min;
        const geom::Point3D last = cut.points.back();
        path.segments.push_back(std::move(cut));

        const geom::Point3D retractTo{last.x, last.y, safeZ};
        const double retract = geom::distance3D(last, retractTo);
        stats.rapidDistance_mm += retract;
        stats.totalDistance_mm += retract;
        stats.estimatedTime_min += retract / kNominalRapidRate_mm_min;
        path.segments.push_back({MoveKind::Retract, {last, retractTo}});
        cursor = retractTo;
    }

    LOG_INFO(Tp, QStringLiteral("Synthesized %1 segments (%2 ramped entries), cut %3 mm, rapid %4 mm")
                     .arg(path.segments.size())
                     .arg(ramps)
                     .arg(stats.cuttingDistance_mm, 0, 'f', 2)
                     .arg(stats.rapidDistance_mm, 0, 'f', 2));
    return path;
}

} // namespace tp
