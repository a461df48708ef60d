#pragma once

#include "tp/Machine.h"
#include "tp/Stock.h"
#include "tp/Tool.h"

#include "geom/Primitives.h"

#include <QtCore/QByteArray>
#include <QtCore/QString>

#include <vector>

namespace tp
{

// Everything one run needs, as read from a job description file.
struct JobConfig
{
    ToolConfig tool{makeDefaultTool()};
    MachineConfig machine{makeDefaultMachine()};
    StockConfig stock{makeDefaultStock()};
    double cutDepth_mm{1.0};
    double stepover_mm{1.0};
    double resolution_mm{0.5};
    bool inverted{false};

    std::vector<geom::Polyline> paths;
    std::vector<float> mesh;

    [[nodiscard]] bool hasMesh() const noexcept { return !mesh.empty(); }
    void ensureValid();
};

// Missing fields keep their defaults. Malformed JSON, a field of the wrong type or an
// unknown tool or origin name throws ConfigError; bad path data propagates the reader's error.
[[nodiscard]] JobConfig loadJobConfig(const QByteArray& json);
[[nodiscard]] JobConfig loadJobConfigFile(const QString& path);

} // namespace tp
