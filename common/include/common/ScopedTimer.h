#pragma once

#include <QtCore/QString>

#include <chrono>
#include <functional>

namespace common
{

// Measures the lifetime of a pipeline stage. On destruction either hands the elapsed time to
// the callback or logs "<label> took N ms" under the tp category.
class ScopedTimer
{
public:
    using Callback = std::function<void(const QString&, double)>;

    explicit ScopedTimer(QString label, Callback callback = {});
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    [[nodiscard]] double elapsedMilliseconds() const;

private:
    QString m_label;
    Callback m_callback;
    std::chrono::steady_clock::time_point m_start;
};

} // namespace common
