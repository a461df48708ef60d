#include "tp/GCodeEmitter.h"

#include "common/log.h"

#include <QtCore/QDateTime>
#include <QtCore/QString>

#include <cmath>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace tp
{

namespace
{

// Modal axes hold the printed word, so a value only counts as changed when its text does.
using ModalAxis = std::optional<std::string>;

std::string coord(double value)
{
    return GCodeEmitter::formatNumber(value);
}

bool changed(const ModalAxis& last, double value)
{
    return !last || *last != coord(value);
}

// Modal machine state plus the text being built.
class ModalWriter
{
public:
    ModalWriter(const ToolConfig& tool, const MachineConfig& machine)
        : m_tool(tool)
        , m_machine(machine)
    {
    }

    void line(const std::string& text) { m_out << text << '\n'; }

    void comment(const std::string& text) { m_out << "; " << text << '\n'; }

    void header(bool timestamp)
    {
        comment("CarveKit G-code");
        if (timestamp)
        {
            comment("Generated: " + QDateTime::currentDateTimeUtc().toString(Qt::ISODate).toStdString());
        }
        comment("Tool: " + toolKindName(m_tool.kind).toStdString() + " D"
                + QString::number(m_tool.diameter_mm, 'g', 6).toStdString() + "mm");
        line("");
        line("G90 ; Absolute positioning");
        line("G21 ; Units: millimeters");
        line("");
        line("S" + GCodeEmitter::formatNumber(m_tool.spindle_rpm, 0) + " M3 ; Spindle ON clockwise");
        line("");
        m_z = coord(m_machine.safeZ_mm);
        line("G0 Z" + *m_z + " ; Move to safe Z");
        line("");
    }

    void footer()
    {
        line("");
        if (changed(m_z, m_machine.safeZ_mm))
        {
            m_z = coord(m_machine.safeZ_mm);
            line("G0 Z" + *m_z + " ; Retract to safe Z");
        }
        // Work origin in machine coordinates, so the design offset is not applied here.
        std::string home = "G0";
        if (changed(m_x, 0.0))
        {
            home += " X" + coord(0.0);
        }
        if (changed(m_y, 0.0))
        {
            home += " Y" + coord(0.0);
        }
        if (home.size() > 2)
        {
            line(home + " ; Return to origin");
        }
        line("M5 ; Spindle OFF");
        line("M2 ; Program end");
    }

    [[nodiscard]] geom::Point3D shifted(const geom::Point3D& p) const
    {
        return {p.x + m_machine.originX_mm, p.y + m_machine.originY_mm, p.z};
    }

    [[nodiscard]] bool atPosition(const geom::Point3D& p) const
    {
        return m_x && m_y && m_z && !changed(m_x, p.x) && !changed(m_y, p.y) && !changed(m_z, p.z);
    }

    // p is already shifted.
    void move(MoveKind kind, const geom::Point3D& p)
    {
        if (atPosition(p))
        {
            return;
        }

        std::string text = (kind == MoveKind::Rapid || kind == MoveKind::Retract) ? "G0" : "G1";
        appendAxis(text, 'X', m_x, p.x);
        appendAxis(text, 'Y', m_y, p.y);
        if (kind == MoveKind::Plunge)
        {
            m_z = coord(p.z);
            text += " Z" + *m_z;
        }
        else
        {
            appendAxis(text, 'Z', m_z, p.z);
        }

        if (kind == MoveKind::Plunge)
        {
            appendFeed(text, m_tool.plungeRate_mm_min);
        }
        else if (kind == MoveKind::Cut)
        {
            appendFeed(text, m_tool.feedRate_mm_min);
        }
        line(text);
    }

    void arc(const FittedMove& fitted)
    {
        const geom::Point3D start = shifted({fitted.start.x, fitted.start.y, fitted.end.z});
        move(MoveKind::Cut, start);

        const geom::Point3D end = shifted(fitted.end);
        std::string text = fitted.clockwise ? "G2" : "G3";
        appendAxis(text, 'X', m_x, end.x);
        appendAxis(text, 'Y', m_y, end.y);
        appendAxis(text, 'Z', m_z, end.z);
        text += " I" + GCodeEmitter::formatNumber(fitted.centerI);
        text += " J" + GCodeEmitter::formatNumber(fitted.centerJ);
        appendFeed(text, m_tool.feedRate_mm_min);
        line(text);
        ++m_arcs;
    }

    [[nodiscard]] int arcCount() const noexcept { return m_arcs; }
    [[nodiscard]] std::string text() const { return m_out.str(); }

private:
    void appendAxis(std::string& text, char axis, ModalAxis& last, double value)
    {
        std::string printed = coord(value);
        if (!last || *last != printed)
        {
            text += ' ';
            text += axis;
            text += printed;
            last = std::move(printed);
        }
    }

    void appendFeed(std::string& text, double feed)
    {
        if (!m_feed || *m_feed != feed)
        {
            text += " F" + GCodeEmitter::formatNumber(feed, 0);
            m_feed = feed;
        }
    }

    const ToolConfig& m_tool;
    const MachineConfig& m_machine;
    std::ostringstream m_out;
    ModalAxis m_x;
    ModalAxis m_y;
    ModalAxis m_z;
    std::optional<double> m_feed;
    int m_arcs{0};
};

} // namespace

GCodeEmitter::GCodeEmitter(Options options)
    : m_options(std::move(options))
{
}

std::string GCodeEmitter::generate(const ToolPath& toolPath,
                                   const ToolConfig& tool,
                                   const MachineConfig& machine) const
{
    return emit(toolPath, tool, machine, false);
}

std::string GCodeEmitter::generateFromRaster(const ToolPath& toolPath,
                                             const ToolConfig& tool,
                                             const MachineConfig& machine) const
{
    return emit(toolPath, tool, machine, true);
}

std::string GCodeEmitter::emit(const ToolPath& toolPath,
                               const ToolConfig& tool,
                               const MachineConfig& machine,
                               bool simplifyCuts) const
{
    ModalWriter writer(tool, machine);
    writer.header(m_options.timestampHeader);

    for (const ToolPathSegment& segment : toolPath.segments)
    {
        if (segment.kind != MoveKind::Cut)
        {
            for (const geom::Point3D& point : segment.points)
            {
                writer.move(segment.kind, writer.shifted(point));
            }
            continue;
        }

        const std::vector<geom::Point3D> points = (simplifyCuts && segment.points.size() > 2)
                                                      ? simplifyCollinear(segment.points,
                                                                          m_options.rasterCollinearTolerance)
                                                      : segment.points;
        if (points.size() < m_options.minArcFitPoints)
        {
            for (const geom::Point3D& point : points)
            {
                writer.move(MoveKind::Cut, writer.shifted(point));
            }
            continue;
        }

        for (const FittedMove& fitted : detectArcs(points, m_options.arcs))
        {
            if (fitted.kind == FittedMove::Kind::Arc)
            {
                writer.arc(fitted);
            }
            else
            {
                writer.move(MoveKind::Cut, writer.shifted(fitted.end));
            }
        }
    }

    writer.footer();
    LOG_INFO(Post, QStringLiteral("Emitted G-code for %1 segments (%2 arcs)")
                       .arg(toolPath.segments.size())
                       .arg(writer.arcCount()));
    return writer.text();
}

std::string GCodeEmitter::formatNumber(double value, int precision)
{
    // Keep "-0.000" out of the output.
    const double scale = std::pow(10.0, precision);
    if (std::abs(value) * scale < 0.5)
    {
        value = 0.0;
    }
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss << std::setprecision(precision) << value;
    return oss.str();
}

GCodeStats parseGCodeStats(const std::string& gcode)
{
    GCodeStats stats;
    std::istringstream in(gcode);
    std::string raw;
    while (std::getline(in, raw))
    {
        const auto first = raw.find_first_not_of(" \t\r");
        if (first == std::string::npos || raw[first] == ';')
        {
            continue;
        }
        const std::string line = raw.substr(first);
        ++stats.lineCount;
        if (line.starts_with("G0"))
        {
            ++stats.rapidMoves;
        }
        else if (line.starts_with("G1"))
        {
            ++stats.linearMoves;
        }
        else if (line.starts_with("G2") || line.starts_with("G3"))
        {
            ++stats.arcMoves;
        }
        if (line.find("M3") != std::string::npos)
        {
            stats.hasSpindleOn = true;
        }
        if (line.find("M5") != std::string::npos)
        {
            stats.hasSpindleOff = true;
        }
    }
    return stats;
}

} // namespace tp
