#pragma once

#include <stdexcept>

namespace tp
{

// Raised for unusable job settings: wrong JSON types, unknown tool or origin names.
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace tp
