#include "common/logging.h"

#include <QtCore/QDateTime>
#include <QtCore/QLoggingCategory>
#include <QtCore/QTextStream>

#include <cstdlib>
#include <cstring>

namespace common
{

namespace
{

constexpr const char* kCategoryPrefix = "carvekit.";

const char* levelTag(QtMsgType type)
{
    switch (type)
    {
    case QtDebugMsg: return "debug";
    case QtInfoMsg: return "info";
    case QtWarningMsg: return "warn";
    case QtCriticalMsg: return "error";
    case QtFatalMsg: return "fatal";
    }
    return "?";
}

// "carvekit.post" prints as "post"; categories from Qt itself print unchanged.
QString shortCategory(const char* category)
{
    if (category == nullptr || std::strcmp(category, "default") == 0)
    {
        return {};
    }
    const std::size_t prefixLength = std::strlen(kCategoryPrefix);
    if (std::strncmp(category, kCategoryPrefix, prefixLength) == 0)
    {
        return QString::fromUtf8(category + prefixLength);
    }
    return QString::fromUtf8(category);
}

void writeToStderr(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
    QTextStream err(stderr);
    err << QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss.zzz")) << ' '
        << levelTag(type);

    const QString category = shortCategory(context.category);
    if (!category.isEmpty())
    {
        err << '/' << category;
    }
    err << ": " << message << Qt::endl;

    if (type == QtFatalMsg)
    {
        std::abort();
    }
}

} // namespace

void initLogging(bool quiet)
{
    qInstallMessageHandler(writeToStderr);

    QString rules = QStringLiteral("carvekit.*.debug=false\n");
    rules += quiet ? QStringLiteral("carvekit.*.info=false") : QStringLiteral("carvekit.*.info=true");
    QLoggingCategory::setFilterRules(rules);
}

} // namespace common
