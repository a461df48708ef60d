#include "tp/GCodeExporter.h"

#include "common/log.h"

#include <QtCore/QFile>

namespace tp
{

bool GCodeExporter::exportToFile(const std::string& gcode, const QString& path, QString* error)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text))
    {
        if (error)
        {
            *error = QStringLiteral("Unable to open %1 for writing.").arg(path);
        }
        return false;
    }

    std::string data = gcode;
    if (!data.empty() && data.back() != '\n')
    {
        data.push_back('\n');
    }

    if (file.write(data.c_str(), static_cast<qint64>(data.size())) == -1)
    {
        if (error)
        {
            *error = QStringLiteral("Failed to write to %1.").arg(path);
        }
        return false;
    }

    LOG_INFO(Post, QStringLiteral("Wrote %1 bytes of G-code to %2").arg(data.size()).arg(path));
    return true;
}

} // namespace tp
