#pragma once

#include "core/AuditResult.hpp"
#include "mcp/ToolRegistry.hpp"
#include <optional>
#include <string>

namespace presence_mcp {

/**
 * @brief MCP tool scoring how clearly AI understands what a brand is
 *
 * Score range is [0, 100]. The description is whitespace-normalized before
 * any check runs, so changing only whitespace never changes the score.
 *
 * With a description the score is 20, plus:
 * - length: +20 for 5-30 words, +10 for 3-4 or 31-50 words
 * - brand named in its own description: +10
 * - says what it does (offering term): +20
 * - says who it serves (audience term): +15
 * - names a concrete outcome: +15
 * - minus 5 per generic marketing term, at most 15
 *
 * Without a description the score is 10-20, derived from the name only.
 */
class EntityClarityScoreTool {
public:
    static constexpr int kMinScore = 0;
    static constexpr int kMaxScore = 100;

    struct Request {
        std::string brand_name;
        std::optional<std::string> description;
    };

    static ToolDescriptor get_info();
    static Request parse(const json& args);

    AuditResult execute(const json& args) const;
    AuditResult run(const Request& request) const;

    /**
     * @brief "Strong" above 75, "Moderate" above 55, otherwise "Needs Work"
     */
    static std::string clarity_level(int score);
};

} // namespace presence_mcp
