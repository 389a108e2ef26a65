#pragma once

#include <stdexcept>
#include <string>

namespace ncf {

/**
 * @brief Client supplied something unusable (bad mode, time, MAC, unset target).
 *
 * Raised before any state is touched. The HTTP layer answers 400.
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& msg)
        : std::invalid_argument(msg) {}
};

/**
 * @brief Persisted state document exists but does not match the schema.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg)
        : std::runtime_error(msg) {}
};

} // namespace ncf
