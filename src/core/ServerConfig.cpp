#include "core/ServerConfig.hpp"
#include "core/Errors.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>

namespace presence_mcp {

namespace {
    constexpr const char* kLoggerName = "presence";
}

void ServerConfig::validate() const {
    if (!parse_log_level(log_level)) {
        throw ConfigError("Invalid log level: " + log_level);
    }
    if (max_frame_bytes == 0) {
        throw ConfigError("max_frame_bytes must be greater than zero");
    }
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
    if (name == "trace") {
        return spdlog::level::trace;
    } else if (name == "debug") {
        return spdlog::level::debug;
    } else if (name == "info") {
        return spdlog::level::info;
    } else if (name == "warn") {
        return spdlog::level::warn;
    } else if (name == "error") {
        return spdlog::level::err;
    } else if (name == "critical") {
        return spdlog::level::critical;
    } else if (name == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

void configure_logging(const ServerConfig& config) {
    // Replace any logger left over from a previous call
    spdlog::drop(kLoggerName);

    std::shared_ptr<spdlog::logger> logger;
    if (config.log_file.empty()) {
        logger = spdlog::stderr_color_mt(kLoggerName);
    } else {
        logger = spdlog::basic_logger_mt(kLoggerName, config.log_file);
    }

    logger->set_level(parse_log_level(config.log_level).value_or(spdlog::level::info));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

} // namespace presence_mcp
