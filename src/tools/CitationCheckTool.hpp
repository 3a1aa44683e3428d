#pragma once

#include "core/AuditResult.hpp"
#include "mcp/ToolRegistry.hpp"
#include <string>
#include <vector>

namespace presence_mcp {

/**
 * @brief MCP tool judging whether AI is likely to cite a brand per topic
 *
 * Each topic gets a likelihood (stable score of brand + topic, 40-90) and
 * counts as cited above kCitedThreshold. Findings come back one per topic,
 * in input order, duplicates included.
 */
class CitationCheckTool {
public:
    static constexpr int kCitedThreshold = 65;

    struct Request {
        std::string brand_name;
        std::vector<std::string> topics;
    };

    static ToolDescriptor get_info();
    static Request parse(const json& args);

    AuditResult execute(const json& args) const;
    AuditResult run(const Request& request) const;
};

} // namespace presence_mcp
