#include "tp/JobConfig.h"

#include "tp/ConfigError.h"

#include "common/log.h"
#include "geom/AffineTransform.h"
#include "vec/PathData.h"

#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>

#include <algorithm>
#include <cmath>

namespace tp
{

namespace
{

constexpr double kMinResolution = 0.01;
constexpr double kMinStepover = 0.01;

[[noreturn]] void fail(const QString& message)
{
    throw ConfigError(message.toStdString());
}

QJsonObject objectField(const QJsonObject& parent, const QString& key)
{
    const QJsonValue value = parent.value(key);
    if (value.isUndefined() || value.isNull())
    {
        return {};
    }
    if (!value.isObject())
    {
        fail(QStringLiteral("Job field \"%1\" must be an object").arg(key));
    }
    return value.toObject();
}

void readNumber(const QJsonObject& obj, const QString& key, double& target)
{
    const QJsonValue value = obj.value(key);
    if (value.isUndefined() || value.isNull())
    {
        return;
    }
    if (!value.isDouble() || !std::isfinite(value.toDouble()))
    {
        fail(QStringLiteral("Job field \"%1\" must be a number").arg(key));
    }
    target = value.toDouble();
}

void readBool(const QJsonObject& obj, const QString& key, bool& target)
{
    const QJsonValue value = obj.value(key);
    if (value.isUndefined() || value.isNull())
    {
        return;
    }
    if (!value.isBool())
    {
        fail(QStringLiteral("Job field \"%1\" must be true or false").arg(key));
    }
    target = value.toBool();
}

QString readString(const QJsonObject& obj, const QString& key)
{
    const QJsonValue value = obj.value(key);
    if (value.isUndefined() || value.isNull())
    {
        return {};
    }
    if (!value.isString())
    {
        fail(QStringLiteral("Job field \"%1\" must be a string").arg(key));
    }
    return value.toString();
}

void parseTool(const QJsonObject& obj, ToolConfig& tool)
{
    const QString type = readString(obj, QStringLiteral("type"));
    if (!type.isEmpty())
    {
        tool.kind = parseToolKind(type);
    }
    readNumber(obj, QStringLiteral("diameter"), tool.diameter_mm);
    readNumber(obj, QStringLiteral("angle"), tool.angle_deg);
    readNumber(obj, QStringLiteral("spindleSpeed"), tool.spindle_rpm);
    readNumber(obj, QStringLiteral("feedRate"), tool.feedRate_mm_min);
    readNumber(obj, QStringLiteral("plungeRate"), tool.plungeRate_mm_min);
}

geom::Polyline parsePointList(const QJsonArray& points, bool closed, int index)
{
    geom::Polyline polyline;
    polyline.closed = closed;
    polyline.points.reserve(static_cast<std::size_t>(points.size()));
    for (const QJsonValue& value : points)
    {
        const QJsonArray pair = value.toArray();
        if (!value.isArray() || pair.size() < 2 || !pair.at(0).isDouble() || !pair.at(1).isDouble())
        {
            fail(QStringLiteral("Path %1: each point must be an [x, y] number pair").arg(index));
        }
        const geom::Point2D point{pair.at(0).toDouble(), pair.at(1).toDouble()};
        if (!std::isfinite(point.x) || !std::isfinite(point.y))
        {
            fail(QStringLiteral("Path %1: non-finite coordinate").arg(index));
        }
        polyline.points.push_back(point);
    }

    if (closed && polyline.points.size() >= 2
        && geom::distance2D(polyline.points.front(), polyline.points.back()) > 1e-9)
    {
        polyline.points.push_back(polyline.points.front());
    }
    return polyline;
}

void parsePaths(const QJsonValue& value, std::vector<geom::Polyline>& paths)
{
    if (value.isUndefined() || value.isNull())
    {
        return;
    }
    if (!value.isArray())
    {
        fail(QStringLiteral("Job field \"paths\" must be an array"));
    }

    int index = 0;
    for (const QJsonValue& entry : value.toArray())
    {
        if (!entry.isObject())
        {
            fail(QStringLiteral("Path %1 must be an object").arg(index));
        }
        const QJsonObject obj = entry.toObject();

        if (obj.contains(QStringLiteral("d")))
        {
            const QString data = readString(obj, QStringLiteral("d"));
            const QString transformText = readString(obj, QStringLiteral("transform"));
            const geom::AffineTransform transform = geom::parseTransform(transformText.toStdString());
            for (geom::Polyline& polyline : vec::parsePathData(data.toStdString(), transform))
            {
                paths.push_back(std::move(polyline));
            }
        }
        else
        {
            const QJsonValue points = obj.value(QStringLiteral("points"));
            if (!points.isArray())
            {
                fail(QStringLiteral("Path %1 needs either \"points\" or \"d\"").arg(index));
            }
            bool closed = false;
            readBool(obj, QStringLiteral("closed"), closed);
            geom::Polyline polyline = parsePointList(points.toArray(), closed, index);
            if (polyline.points.size() >= 2)
            {
                paths.push_back(std::move(polyline));
            }
        }
        ++index;
    }
}

void parseMesh(const QJsonValue& value, std::vector<float>& mesh)
{
    if (value.isUndefined() || value.isNull())
    {
        return;
    }
    if (!value.isArray())
    {
        fail(QStringLiteral("Job field \"mesh\" must be an array of numbers"));
    }
    const QJsonArray array = value.toArray();
    mesh.reserve(static_cast<std::size_t>(array.size()));
    for (const QJsonValue& v : array)
    {
        if (!v.isDouble())
        {
            fail(QStringLiteral("Job field \"mesh\" must be an array of numbers"));
        }
        mesh.push_back(static_cast<float>(v.toDouble()));
    }
}

} // namespace

void JobConfig::ensureValid()
{
    tool.ensureValid();
    machine.ensureValid();
    stock.ensureValid();
    cutDepth_mm = std::max(cutDepth_mm, 0.0);
    stepover_mm = std::max(stepover_mm, kMinStepover);
    resolution_mm = std::max(resolution_mm, kMinResolution);
}

JobConfig loadJobConfig(const QByteArray& json)
{
    if (json.trimmed().isEmpty())
    {
        fail(QStringLiteral("Job description is empty"));
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError)
    {
        fail(QStringLiteral("Failed to parse job description at offset %1: %2")
                 .arg(parseError.offset)
                 .arg(parseError.errorString()));
    }
    if (!doc.isObject())
    {
        fail(QStringLiteral("Job description must be a JSON object"));
    }

    const QJsonObject root = doc.object();
    JobConfig job;

    parseTool(objectField(root, QStringLiteral("tool")), job.tool);

    const QJsonObject stock = objectField(root, QStringLiteral("stock"));
    readNumber(stock, QStringLiteral("width"), job.stock.width_mm);
    readNumber(stock, QStringLiteral("height"), job.stock.height_mm);
    readNumber(stock, QStringLiteral("thickness"), job.stock.thickness_mm);

    const QJsonObject machine = objectField(root, QStringLiteral("machine"));
    readNumber(machine, QStringLiteral("safeZ"), job.machine.safeZ_mm);

    readNumber(root, QStringLiteral("cutDepth"), job.cutDepth_mm);
    readNumber(root, QStringLiteral("stepover"), job.stepover_mm);
    readNumber(root, QStringLiteral("resolution"), job.resolution_mm);
    readBool(root, QStringLiteral("inverted"), job.inverted);

    parsePaths(root.value(QStringLiteral("paths")), job.paths);
    parseMesh(root.value(QStringLiteral("mesh")), job.mesh);

    job.ensureValid();

    // Offsets depend on the clamped stock size.
    const QString origin = readString(machine, QStringLiteral("origin"));
    applyOrigin(job.machine,
                origin.isEmpty() ? job.machine.origin : parseOriginPosition(origin),
                job.stock);

    LOG_INFO(App, QStringLiteral("Job: %1 path(s), %2 mesh triangle(s), tool %3 D%4, origin %5")
                      .arg(job.paths.size())
                      .arg(job.mesh.size() / 9)
                      .arg(toolKindName(job.tool.kind))
                      .arg(job.tool.diameter_mm)
                      .arg(originPositionName(job.machine.origin)));
    return job;
}

JobConfig loadJobConfigFile(const QString& path)
{
    QFile file(path);
    if (!file.exists())
    {
        fail(QStringLiteral("Job file not found: %1").arg(path));
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        fail(QStringLiteral("Unable to open job file: %1").arg(path));
    }
    return loadJobConfig(file.readAll());
}

} // namespace tp
