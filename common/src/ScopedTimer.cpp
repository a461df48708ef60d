#include "common/ScopedTimer.h"

#include "common/log.h"

#include <utility>

namespace common
{

ScopedTimer::ScopedTimer(QString label, Callback callback)
    : m_label(std::move(label))
    , m_callback(std::move(callback))
    , m_start(std::chrono::steady_clock::now())
{
}

ScopedTimer::~ScopedTimer()
{
    const double ms = elapsedMilliseconds();
    if (m_callback)
    {
        m_callback(m_label, ms);
        return;
    }
    LOG_INFO(Tp, QStringLiteral("%1 took %2 ms").arg(m_label).arg(ms, 0, 'f', 2));
}

double ScopedTimer::elapsedMilliseconds() const
{
    const auto elapsed = std::chrono::steady_clock::now() - m_start;
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

} // namespace common
