#include "tp/Pipeline.h"

#include "tp/GCodeEmitter.h"
#include "tp/JobConfig.h"
#include "tp/PathSynthesizer.h"
#include "tp/RasterGenerator.h"
#include "tp/TravelOptimizer.h"
#include "tp/heightfield/DropCutter.h"
#include "tp/heightfield/HeightMap.h"

#include "common/ScopedTimer.h"
#include "common/log.h"
#include "vec/Offset.h"

#include <algorithm>
#include <utility>

namespace tp
{

namespace
{

// Forwards to the caller's observer, never reporting a value lower than the last one.
class ProgressReporter
{
public:
    explicit ProgressReporter(const ProgressCallback& callback)
        : m_callback(callback)
    {
    }

    void report(int percent)
    {
        percent = std::clamp(percent, 0, 100);
        if (percent < m_last)
        {
            return;
        }
        m_last = percent;
        if (m_callback)
        {
            m_callback(percent);
        }
    }

    // Maps a 0..100 sub-stage onto [from, from + span].
    [[nodiscard]] ProgressCallback scaled(int from, double span)
    {
        return [this, from, span](int pct)
        {
            report(from + static_cast<int>(span * pct / 100.0));
        };
    }

private:
    const ProgressCallback& m_callback;
    int m_last{0};
};

} // namespace

VectorJob makeVectorJob(const JobConfig& config)
{
    VectorJob job;
    job.polylines = config.paths;
    job.tool = config.tool;
    job.machine = config.machine;
    job.cutDepth_mm = config.cutDepth_mm;
    return job;
}

MeshJob makeMeshJob(const JobConfig& config)
{
    MeshJob job;
    job.triangles = meshFromFlatVertices(config.mesh);
    job.tool = config.tool;
    job.machine = config.machine;
    job.stock = config.stock;
    job.resolution_mm = config.resolution_mm;
    job.stepover_mm = config.stepover_mm;
    job.inverted = config.inverted;
    return job;
}

JobResult runVectorJob(const VectorJob& job, const ProgressCallback& progress)
{
    common::ScopedTimer total(QStringLiteral("Vector job"));
    ProgressReporter reporter(progress);

    std::vector<geom::Polyline> discretized;
    {
        common::ScopedTimer timer(QStringLiteral("Discretize"));
        discretized = vec::processPolylines(job.polylines, job.discretize);
    }
    reporter.report(10);

    std::vector<geom::Polyline> offset;
    {
        common::ScopedTimer timer(QStringLiteral("Offset"));
        offset = vec::offsetForTool(discretized, job.tool.radius());
    }
    reporter.report(30);

    std::vector<geom::Polyline> ordered;
    {
        common::ScopedTimer timer(QStringLiteral("Optimize order"));
        ordered = optimizePathOrder(offset);
    }
    reporter.report(50);

    SynthesisParams params;
    params.cutDepth_mm = job.cutDepth_mm;
    params.safeZ_mm = job.machine.safeZ_mm;
    params.feedRate_mm_min = job.tool.feedRate_mm_min;
    params.plungeRate_mm_min = job.tool.plungeRate_mm_min;

    ToolPath toolPath;
    {
        common::ScopedTimer timer(QStringLiteral("Synthesize"));
        toolPath = synthesizeToolpath(ordered, params);
    }
    reporter.report(70);

    JobResult result;
    {
        common::ScopedTimer timer(QStringLiteral("Emit"));
        result.gcode = GCodeEmitter().generate(toolPath, job.tool, job.machine);
    }
    reporter.report(90);

    result.buffer = toFlatBuffer(toolPath);
    result.stats = toolPath.stats;
    reporter.report(100);
    return result;
}

JobResult runMeshJob(const MeshJob& job, const ProgressCallback& progress)
{
    common::ScopedTimer total(QStringLiteral("Mesh job"));
    ProgressReporter reporter(progress);

    const heightfield::ZMapConfig config = heightfield::makeZMapConfig(job.stock, job.resolution_mm);
    LOG_INFO(Tp, QStringLiteral("Mesh job: %1 triangles, %2x%3 grid at %4 mm")
                     .arg(job.triangles.size())
                     .arg(config.gridWidth)
                     .arg(config.gridHeight)
                     .arg(job.resolution_mm));
    reporter.report(10);

    heightfield::HeightMap heightMap =
        heightfield::computeHeightMap(job.triangles, config, job.tool, reporter.scaled(10, 60.0));
    reporter.report(70);

    if (job.inverted)
    {
        heightMap = heightfield::invertHeightMap(heightMap);
    }
    reporter.report(75);

    RasterParams params;
    params.stepover_mm = job.stepover_mm;
    params.safeZ_mm = job.machine.safeZ_mm;
    params.feedRate_mm_min = job.tool.feedRate_mm_min;
    params.plungeRate_mm_min = job.tool.plungeRate_mm_min;

    ToolPath toolPath;
    {
        common::ScopedTimer timer(QStringLiteral("Raster"));
        toolPath = generateRasterPaths(heightMap, params, reporter.scaled(75, 10.0));
    }
    reporter.report(85);

    JobResult result;
    {
        common::ScopedTimer timer(QStringLiteral("Emit"));
        result.gcode = GCodeEmitter().generateFromRaster(toolPath, job.tool, job.machine);
    }
    reporter.report(90);

    result.buffer = toFlatBuffer(toolPath);
    result.stats = toolPath.stats;
    reporter.report(100);
    return result;
}

} // namespace tp
