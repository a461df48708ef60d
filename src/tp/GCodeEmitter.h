#pragma once

#include "tp/ArcFitter.h"
#include "tp/Machine.h"
#include "tp/Tool.h"
#include "tp/Toolpath.h"

#include <cstddef>
#include <string>

namespace tp
{

// Serializes a ToolPath to metric, absolute G-code. Coordinates, feed and the origin shift are
// modal: a field is only written when it changed by more than the coordinate tolerance, and a
// move that changes nothing is dropped.
class GCodeEmitter
{
public:
    struct Options
    {
        ArcFitOptions arcs;
        std::size_t minArcFitPoints{4};
        double rasterCollinearTolerance{0.005};
        bool timestampHeader{true};
    };

    GCodeEmitter() = default;
    explicit GCodeEmitter(Options options);

    // Vector jobs: cut runs are arc-fitted.
    [[nodiscard]] std::string generate(const ToolPath& toolPath,
                                       const ToolConfig& tool,
                                       const MachineConfig& machine) const;

    // Mesh jobs: cut runs are collinear-simplified first, then arc-fitted.
    [[nodiscard]] std::string generateFromRaster(const ToolPath& toolPath,
                                                 const ToolConfig& tool,
                                                 const MachineConfig& machine) const;

    [[nodiscard]] const Options& options() const noexcept { return m_options; }

    static std::string formatNumber(double value, int precision = 3);

private:
    [[nodiscard]] std::string emit(const ToolPath& toolPath,
                                   const ToolConfig& tool,
                                   const MachineConfig& machine,
                                   bool simplifyCuts) const;

    Options m_options;
};

struct GCodeStats
{
    int lineCount{0};
    int rapidMoves{0};
    int linearMoves{0};
    int arcMoves{0};
    bool hasSpindleOn{false};
    bool hasSpindleOff{false};
};

// Counts non-empty, non-comment lines and the motion words they start with.
[[nodiscard]] GCodeStats parseGCodeStats(const std::string& gcode);

} // namespace tp
