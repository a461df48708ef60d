#pragma once

#include "tp/Machine.h"
#include "tp/MeshInput.h"
#include "tp/Stock.h"
#include "tp/Tool.h"
#include "tp/Toolpath.h"

#include "geom/Primitives.h"
#include "vec/Discretizer.h"

#include <functional>
#include <string>
#include <vector>

namespace tp
{

struct JobConfig;

using ProgressCallback = std::function<void(int)>;

struct VectorJob
{
    std::vector<geom::Polyline> polylines;
    ToolConfig tool{makeDefaultTool()};
    MachineConfig machine{makeDefaultMachine()};
    double cutDepth_mm{1.0};
    vec::DiscretizeOptions discretize{};
};

struct MeshJob
{
    std::vector<Triangle> triangles;
    ToolConfig tool{makeDefaultTool()};
    MachineConfig machine{makeDefaultMachine()};
    StockConfig stock{makeDefaultStock()};
    double resolution_mm{0.5};
    double stepover_mm{1.0};
    bool inverted{false};
};

struct JobResult
{
    std::string gcode;
    std::vector<float> buffer; // x, y, z, kind per point
    ToolPathStats stats;
};

[[nodiscard]] VectorJob makeVectorJob(const JobConfig& config);
// Throws MeshInputError when the job's vertex buffer is malformed.
[[nodiscard]] MeshJob makeMeshJob(const JobConfig& config);

// discretize 10, offset 30, optimize 50, synthesize 70, emit 90, done 100.
[[nodiscard]] JobResult runVectorJob(const VectorJob& job, const ProgressCallback& progress = {});

// height map 10..70, raster 75..85, emit 90, done 100.
[[nodiscard]] JobResult runMeshJob(const MeshJob& job, const ProgressCallback& progress = {});

} // namespace tp
