#pragma once

#include <spdlog/common.h>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace presence_mcp {

/**
 * @brief Runtime settings collected from the command line
 *
 * Nothing here is read from the environment. Defaults describe a
 * permissive server logging at info level to stderr.
 */
struct ServerConfig {
    std::string log_level = "info";
    std::string log_file;                       // empty: log to stderr
    bool require_initialize = false;            // reject tools/call before initialize
    std::size_t max_frame_bytes = 4 * 1024 * 1024;

    /**
     * @brief Check option consistency
     * @throws ConfigError on an unknown log level or a zero frame limit
     */
    void validate() const;
};

/**
 * @brief Map a level name to spdlog's enum
 *
 * Accepts trace, debug, info, warn, error, critical and off.
 * @return Level, or nullopt when the name is not recognized
 */
std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

/**
 * @brief Install the process-wide logger
 *
 * stdout carries protocol frames, so the logger writes to stderr unless
 * a log file is configured.
 */
void configure_logging(const ServerConfig& config);

} // namespace presence_mcp
