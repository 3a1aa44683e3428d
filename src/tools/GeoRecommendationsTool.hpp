#pragma once

#include "core/AuditResult.hpp"
#include "mcp/ToolRegistry.hpp"
#include <string>
#include <vector>

namespace presence_mcp {

/**
 * @brief MCP tool testing whether AI recommends a brand per location
 *
 * Each location gets a likelihood (stable score of brand + location) and
 * counts as recommended above kRecommendedThreshold. One finding per
 * location, in input order.
 */
class GeoRecommendationsTool {
public:
    static constexpr int kRecommendedThreshold = 62;

    struct Request {
        std::string brand_name;
        std::string service;
        std::vector<std::string> locations;
    };

    static ToolDescriptor get_info();
    static Request parse(const json& args);

    AuditResult execute(const json& args) const;
    AuditResult run(const Request& request) const;
};

} // namespace presence_mcp
