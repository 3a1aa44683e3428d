#pragma once

#include "core/AuditResult.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace presence_mcp {

using json = nlohmann::json;

/**
 * @brief Declared type of a tool parameter
 */
enum class ParamType {
    String,
    Integer,
    Number,
    Boolean,
    StringArray
};

/**
 * @brief JSON Schema type name ("string", "array", ...)
 */
std::string_view to_string(ParamType type);

/**
 * @brief One named parameter of a tool
 */
struct ParamSpec {
    std::string name;
    ParamType type = ParamType::String;
    std::string description;
    bool required = true;
    std::size_t max_items = 0;     // StringArray only, 0 = unbounded
    std::size_t max_length = 0;    // String and array elements, 0 = unbounded
};

/**
 * @brief Metadata for an MCP tool
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ParamSpec> params;

    /**
     * @brief Find a parameter by name
     * @return Pointer into params, or nullptr
     */
    const ParamSpec* find_param(std::string_view param_name) const;

    /**
     * @brief Render the parameter list as a JSON Schema object
     */
    json input_schema() const;

    /**
     * @brief tools/list entry: name, description, inputSchema
     */
    json to_json() const;
};

/**
 * @brief Function signature for tool execution
 * @param args Arguments already validated against the descriptor
 * @return Audit result of the tool
 */
using ToolHandler = std::function<AuditResult(const json& args)>;

/**
 * @brief Registry entry pairing a descriptor with its handler
 */
struct RegisteredTool {
    ToolDescriptor descriptor;
    ToolHandler handler;
};

/**
 * @brief Fixed catalogue of tools, immutable once built
 *
 * Only const queries exist, so a built registry can be read from any
 * number of threads. Use ToolRegistry::Builder to construct one.
 */
class ToolRegistry {
public:
    /**
     * @brief Collects tools and produces an immutable registry
     */
    class Builder {
    public:
        /**
         * @brief Add a tool
         * @throws RegistryError on an empty or malformed name, a duplicate
         *         tool or parameter name, or a null handler
         */
        Builder& add(ToolDescriptor descriptor, ToolHandler handler);

        ToolRegistry build();

    private:
        std::vector<RegisteredTool> tools_;
    };

    /**
     * @brief All tools in registration order
     */
    const std::vector<RegisteredTool>& tools() const noexcept { return tools_; }

    /**
     * @brief Resolve a tool by name
     * @return Registry entry, or nullptr when not registered
     */
    const RegisteredTool* find(std::string_view name) const;

    bool contains(std::string_view name) const { return find(name) != nullptr; }
    std::size_t size() const noexcept { return tools_.size(); }

    /**
     * @brief Names in registration order
     */
    std::vector<std::string> names() const;

private:
    explicit ToolRegistry(std::vector<RegisteredTool> tools);

    std::vector<RegisteredTool> tools_;
    std::map<std::string, std::size_t, std::less<>> index_;
};

} // namespace presence_mcp
