#pragma once

#include <stdexcept>
#include <string>

namespace presence_mcp {

/**
 * @brief Thrown when the static tool catalogue cannot be built
 *
 * Raised during startup only; the process exits non-zero before
 * entering the session loop.
 */
class RegistryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Thrown when command-line configuration is inconsistent
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace presence_mcp
