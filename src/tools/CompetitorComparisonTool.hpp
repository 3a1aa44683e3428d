#pragma once

#include "core/AuditResult.hpp"
#include "mcp/ToolRegistry.hpp"
#include <string>
#include <vector>

namespace presence_mcp {

/**
 * @brief MCP tool ranking a brand against its competitors for AI visibility
 *
 * Every distinct name in {brand} ∪ competitors is scored with the stable
 * score of name + category. Ranking is by score descending; equal scores
 * are ordered by ascending byte-wise comparison of the names. Blank and
 * repeated names are collapsed; a competitor equal to the brand is dropped.
 */
class CompetitorComparisonTool {
public:
    struct Request {
        std::string brand_name;
        std::vector<std::string> competitors;
        std::string category;
    };

    struct RankedEntry {
        std::string name;
        int score = 0;
        bool is_brand = false;
    };

    static ToolDescriptor get_info();
    static Request parse(const json& args);

    /**
     * @brief Score and order all entries
     * @return Entries ranked best first
     */
    static std::vector<RankedEntry> rank(const Request& request);

    AuditResult execute(const json& args) const;
    AuditResult run(const Request& request) const;
};

} // namespace presence_mcp
