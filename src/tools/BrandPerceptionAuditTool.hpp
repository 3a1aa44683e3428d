#pragma once

#include "core/AuditResult.hpp"
#include "mcp/ToolRegistry.hpp"
#include <optional>
#include <string>

namespace presence_mcp {

/**
 * @brief MCP tool estimating how AI assistants perceive a brand overall
 *
 * Combines four sub-scores, each 0-100:
 * - category_clarity: 30 + 20 per distinct non-generic industry word, capped
 *   at 90. Adding descriptive words to the industry never lowers it.
 * - name_distinctiveness: stable score of the brand name, penalized when the
 *   name is made only of generic marketing terms
 * - trust_signals: website supplied, served over https, plausible domain
 * - market_presence: stable score of brand + industry
 *
 * The overall score is their integer mean.
 */
class BrandPerceptionAuditTool {
public:
    struct Request {
        std::string brand_name;
        std::string industry;
        std::optional<std::string> website;
    };

    /**
     * @brief Get tool metadata and parameter schema
     */
    static ToolDescriptor get_info();

    /**
     * @brief Build a typed request from validated arguments
     */
    static Request parse(const json& args);

    /**
     * @brief Execute tool with validated arguments
     */
    AuditResult execute(const json& args) const;

    AuditResult run(const Request& request) const;

    static int category_clarity(const std::string& industry);
    static int name_distinctiveness(const std::string& brand_name);
    static int trust_signals(const std::optional<std::string>& website);
};

} // namespace presence_mcp
