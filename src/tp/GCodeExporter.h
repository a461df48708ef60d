#pragma once

#include <QtCore/QString>

#include <string>

namespace tp
{

class GCodeExporter
{
public:
    static bool exportToFile(const std::string& gcode, const QString& path, QString* error = nullptr);
};

} // namespace tp
