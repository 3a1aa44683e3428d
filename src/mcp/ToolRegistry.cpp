#include "ToolRegistry.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

namespace presence_mcp {

namespace {

bool is_valid_tool_name(const std::string& name) {
    if (name.empty() || name.size() > 64) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_' || c == '-';
    });
}

} // namespace

std::string_view to_string(ParamType type) {
    switch (type) {
        case ParamType::String: return "string";
        case ParamType::Integer: return "integer";
        case ParamType::Number: return "number";
        case ParamType::Boolean: return "boolean";
        case ParamType::StringArray: return "array";
    }
    return "string";
}

const ParamSpec* ToolDescriptor::find_param(std::string_view param_name) const {
    auto it = std::find_if(params.begin(), params.end(),
        [param_name](const ParamSpec& param) { return param.name == param_name; });
    return it == params.end() ? nullptr : &*it;
}

json ToolDescriptor::input_schema() const {
    json properties = json::object();
    json required = json::array();

    for (const auto& param : params) {
        json property = {
            {"type", std::string(to_string(param.type))},
            {"description", param.description}
        };
        if (param.type == ParamType::StringArray) {
            property["items"] = {{"type", "string"}};
            if (param.max_items > 0) {
                property["maxItems"] = param.max_items;
            }
        }
        if (param.max_length > 0 && param.type == ParamType::String) {
            property["maxLength"] = param.max_length;
        }
        properties[param.name] = property;

        if (param.required) {
            required.push_back(param.name);
        }
    }

    return {
        {"type", "object"},
        {"properties", properties},
        {"required", required},
        {"additionalProperties", false}
    };
}

json ToolDescriptor::to_json() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema()}
    };
}

ToolRegistry::Builder& ToolRegistry::Builder::add(ToolDescriptor descriptor, ToolHandler handler) {
    if (!is_valid_tool_name(descriptor.name)) {
        throw RegistryError("Invalid tool name: '" + descriptor.name + "'");
    }
    if (!handler) {
        throw RegistryError("Tool handler cannot be null: " + descriptor.name);
    }

    bool duplicate = std::any_of(tools_.begin(), tools_.end(),
        [&descriptor](const RegisteredTool& tool) { return tool.descriptor.name == descriptor.name; });
    if (duplicate) {
        throw RegistryError("Duplicate tool name: " + descriptor.name);
    }

    std::set<std::string> param_names;
    for (const auto& param : descriptor.params) {
        if (param.name.empty()) {
            throw RegistryError("Tool " + descriptor.name + " has a parameter with an empty name");
        }
        if (!param_names.insert(param.name).second) {
            throw RegistryError("Tool " + descriptor.name + " declares parameter twice: " + param.name);
        }
    }

    spdlog::debug("Registered tool: {}", descriptor.name);
    tools_.push_back({std::move(descriptor), std::move(handler)});
    return *this;
}

ToolRegistry ToolRegistry::Builder::build() {
    return ToolRegistry(std::move(tools_));
}

ToolRegistry::ToolRegistry(std::vector<RegisteredTool> tools)
    : tools_(std::move(tools)) {
    for (std::size_t i = 0; i < tools_.size(); ++i) {
        index_.emplace(tools_[i].descriptor.name, i);
    }
}

const RegisteredTool* ToolRegistry::find(std::string_view name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &tools_[it->second];
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(tools_.size());
    for (const auto& tool : tools_) {
        result.push_back(tool.descriptor.name);
    }
    return result;
}

} // namespace presence_mcp
