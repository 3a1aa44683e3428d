#pragma once

#include "ToolRegistry.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace presence_mcp {

/**
 * @brief First problem found in a tool's arguments
 */
struct SchemaViolation {
    std::string field;    // offending parameter name
    std::string reason;

    std::string message() const;
};

/**
 * @brief Checks tool arguments against a ToolDescriptor
 *
 * Rules, applied in declaration order so the reported field is stable:
 * - every required parameter is present and not null
 * - every present parameter has its declared type
 * - required strings are not blank
 * - arrays hold only strings and respect max_items
 * - strings respect max_length
 * - no argument names a parameter the tool does not declare
 */
class SchemaValidator {
public:
    /**
     * @brief Validate arguments
     * @param descriptor Tool whose schema applies
     * @param args Arguments object from tools/call
     * @return The first violation, or nullopt when the arguments are valid
     */
    static std::optional<SchemaViolation> validate(const ToolDescriptor& descriptor,
                                                   const json& args);

private:
    static std::optional<std::string> check_type(const ParamSpec& param, const json& value);
};

} // namespace presence_mcp
