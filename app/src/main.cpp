#include "common/log.h"
#include "common/logging.h"
#include "tp/GCodeExporter.h"
#include "tp/JobConfig.h"
#include "tp/Pipeline.h"

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>

#include <exception>
#include <vector>

namespace
{

bool writePreview(const std::vector<float>& buffer, const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
    {
        LOG_ERR(App, QStringLiteral("Unable to open %1 for writing.").arg(path));
        return false;
    }
    const auto bytes = static_cast<qint64>(buffer.size() * sizeof(float));
    if (file.write(reinterpret_cast<const char*>(buffer.data()), bytes) != bytes)
    {
        LOG_ERR(App, QStringLiteral("Failed to write preview buffer to %1.").arg(path));
        return false;
    }
    LOG_INFO(App, QStringLiteral("Preview buffer: %1 points -> %2").arg(buffer.size() / 4).arg(path));
    return true;
}

int run(const QCommandLineParser& parser)
{
    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1)
    {
        LOG_ERR(App, "Expected exactly one job file.");
        return 2;
    }

    const QString jobPath = positional.front();
    const tp::JobConfig config = tp::loadJobConfigFile(jobPath);

    QString mode = parser.value(QStringLiteral("mode"));
    if (mode.isEmpty())
    {
        mode = config.hasMesh() ? QStringLiteral("mesh") : QStringLiteral("vector");
    }

    const auto progress = [](int pct)
    {
        LOG_INFO(App, QStringLiteral("Progress %1%").arg(pct));
    };

    tp::JobResult result;
    if (mode == QLatin1String("mesh"))
    {
        result = tp::runMeshJob(tp::makeMeshJob(config), progress);
    }
    else if (mode == QLatin1String("vector"))
    {
        result = tp::runVectorJob(tp::makeVectorJob(config), progress);
    }
    else
    {
        LOG_ERR(App, QStringLiteral("Unknown mode \"%1\" (expected vector or mesh).").arg(mode));
        return 2;
    }

    QString outPath = parser.value(QStringLiteral("output"));
    if (outPath.isEmpty())
    {
        const QFileInfo info(jobPath);
        outPath = info.dir().filePath(info.completeBaseName() + QStringLiteral(".nc"));
    }

    QString error;
    if (!tp::GCodeExporter::exportToFile(result.gcode, outPath, &error))
    {
        LOG_ERR(App, error);
        return 1;
    }

    const QString previewPath = parser.value(QStringLiteral("preview"));
    if (!previewPath.isEmpty() && !writePreview(result.buffer, previewPath))
    {
        return 1;
    }

    LOG_INFO(App, QStringLiteral("Cutting %1 mm, rapid %2 mm, estimated %3 min")
                      .arg(result.stats.cuttingDistance_mm, 0, 'f', 1)
                      .arg(result.stats.rapidDistance_mm, 0, 'f', 1)
                      .arg(result.stats.estimatedTime_min, 0, 'f', 2));
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("carvekit"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Turns vector drawings and meshes into router G-code."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("job"), QStringLiteral("Job description (JSON)."));
    parser.addOption({{QStringLiteral("o"), QStringLiteral("output")},
                      QStringLiteral("G-code output file."),
                      QStringLiteral("file")});
    parser.addOption({QStringLiteral("mode"),
                      QStringLiteral("vector or mesh; defaults to mesh when the job has a mesh."),
                      QStringLiteral("mode")});
    parser.addOption({QStringLiteral("preview"),
                      QStringLiteral("Write the flat toolpath buffer (x, y, z, kind floats)."),
                      QStringLiteral("file")});
    parser.addOption({{QStringLiteral("q"), QStringLiteral("quiet")},
                      QStringLiteral("Only print warnings and errors.")});
    parser.process(app);

    common::initLogging(parser.isSet(QStringLiteral("quiet")));

    try
    {
        return run(parser);
    }
    catch (const std::exception& e)
    {
        LOG_ERR(App, QStringLiteral("Job failed: %1").arg(QString::fromStdString(e.what())));
        return 1;
    }
}
