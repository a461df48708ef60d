#pragma once

#include <stdexcept>
#include <string>

namespace common
{

// Raised when an internal precondition of the toolpath engine does not hold.
class InvariantError : public std::logic_error
{
public:
    InvariantError(const char* expression, const char* file, int line, const std::string& message)
        : std::logic_error(message + " (" + expression + " at " + file + ':' + std::to_string(line) + ')')
        , m_expression(expression)
        , m_line(line)
    {
    }

    [[nodiscard]] const char* expression() const noexcept { return m_expression; }
    [[nodiscard]] int line() const noexcept { return m_line; }

private:
    const char* m_expression;
    int m_line;
};

} // namespace common

// Checked in every build.
#define CARVEKIT_ENFORCE(expr, message)                                                    \
    do                                                                                    \
    {                                                                                     \
        if (!(expr))                                                                      \
        {                                                                                 \
            throw ::common::InvariantError(#expr, __FILE__, __LINE__, (message));         \
        }                                                                                 \
    } while (false)
