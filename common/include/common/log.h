#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

#include <sstream>
#include <string>
#include <utility>

namespace common::log
{

enum class Level
{
    Info,
    Warning,
    Error
};

enum class Category
{
    Geom,
    Vec,
    Tp,
    Mesh,
    Post,
    App
};

constexpr const char* categoryName(Category category)
{
    switch (category)
    {
    case Category::Geom: return "carvekit.geom";
    case Category::Vec: return "carvekit.vec";
    case Category::Tp: return "carvekit.tp";
    case Category::Mesh: return "carvekit.mesh";
    case Category::Post: return "carvekit.post";
    case Category::App: return "carvekit.app";
    }
    return "carvekit";
}

namespace detail
{

// One QLoggingCategory per enum value; Qt requires the category name to outlive it.
inline QLoggingCategory& categoryHandle(Category category)
{
    switch (category)
    {
    case Category::Geom: {
        static QLoggingCategory instance(categoryName(Category::Geom));
        return instance;
    }
    case Category::Vec: {
        static QLoggingCategory instance(categoryName(Category::Vec));
        return instance;
    }
    case Category::Tp: {
        static QLoggingCategory instance(categoryName(Category::Tp));
        return instance;
    }
    case Category::Mesh: {
        static QLoggingCategory instance(categoryName(Category::Mesh));
        return instance;
    }
    case Category::Post: {
        static QLoggingCategory instance(categoryName(Category::Post));
        return instance;
    }
    case Category::App: {
        static QLoggingCategory instance(categoryName(Category::App));
        return instance;
    }
    }
    static QLoggingCategory fallback("carvekit");
    return fallback;
}

inline QString toMessage(const QString& message)
{
    return message;
}

inline QString toMessage(const char* message)
{
    return message ? QString::fromUtf8(message) : QString();
}

inline QString toMessage(const std::string& message)
{
    return QString::fromStdString(message);
}

template <typename T>
QString toMessage(const T& value)
{
    std::ostringstream stream;
    stream << value;
    return QString::fromStdString(stream.str());
}

} // namespace detail

inline void write(Level level, Category category, const QString& message)
{
    QLoggingCategory& qtCategory = detail::categoryHandle(category);
    switch (level)
    {
    case Level::Info:
        qCInfo(qtCategory).noquote() << message;
        break;
    case Level::Warning:
        qCWarning(qtCategory).noquote() << message;
        break;
    case Level::Error:
        qCCritical(qtCategory).noquote() << message;
        break;
    }
}

template <typename Message>
void log(Level level, Category category, Message&& message)
{
    write(level, category, detail::toMessage(std::forward<Message>(message)));
}

} // namespace common::log

#define LOG_INFO(category, message)                                                           \
    do                                                                                        \
    {                                                                                         \
        ::common::log::log(::common::log::Level::Info, ::common::log::Category::category,     \
                           (message));                                                        \
    } while (false)

#define LOG_WARN(category, message)                                                           \
    do                                                                                        \
    {                                                                                         \
        ::common::log::log(::common::log::Level::Warning, ::common::log::Category::category,  \
                           (message));                                                        \
    } while (false)

#define LOG_ERR(category, message)                                                            \
    do                                                                                        \
    {                                                                                         \
        ::common::log::log(::common::log::Level::Error, ::common::log::Category::category,    \
                           (message));                                                        \
    } while (false)
