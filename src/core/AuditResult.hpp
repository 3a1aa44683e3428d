#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace presence_mcp {

using json = nlohmann::json;

/**
 * @brief One supporting observation in an audit
 */
struct Finding {
    std::string subject;       // topic, city, signal or brand the finding is about
    std::string observation;
    json evidence = json::object();
};

/**
 * @brief Common output of every analysis tool: score + findings + recommendations
 *
 * Tool-specific fields (sub-scores, leader, test prompts, ...) go in
 * @c details so the shared shape stays fixed.
 */
struct AuditResult {
    std::string tool;
    std::string title;
    std::string brand;
    int score = 0;             // 0-100
    std::string rating;        // categorical reading of score
    std::string summary;
    std::vector<Finding> findings;
    std::vector<std::string> recommendations;
    json details = json::object();

    /**
     * @brief Structured form returned as MCP structuredContent
     */
    json to_json() const;

    /**
     * @brief Human-readable report returned as MCP text content
     */
    std::string to_markdown() const;
};

} // namespace presence_mcp
