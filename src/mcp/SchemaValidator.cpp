#include "SchemaValidator.hpp"
#include "core/TextAnalysis.hpp"

namespace presence_mcp {

std::string SchemaViolation::message() const {
    return "Invalid parameter '" + field + "': " + reason;
}

std::optional<SchemaViolation> SchemaValidator::validate(const ToolDescriptor& descriptor,
                                                         const json& args) {
    if (!args.is_object()) {
        return SchemaViolation{"arguments", "must be an object"};
    }

    for (const auto& param : descriptor.params) {
        auto it = args.find(param.name);
        if (it == args.end() || it->is_null()) {
            if (param.required) {
                return SchemaViolation{param.name, "missing required parameter"};
            }
            continue;
        }

        if (auto reason = check_type(param, *it)) {
            return SchemaViolation{param.name, *reason};
        }
    }

    for (const auto& item : args.items()) {
        if (!descriptor.find_param(item.key())) {
            return SchemaViolation{item.key(), "unknown parameter"};
        }
    }

    return std::nullopt;
}

std::optional<std::string> SchemaValidator::check_type(const ParamSpec& param, const json& value) {
    switch (param.type) {
        case ParamType::String: {
            if (!value.is_string()) {
                return "expected string";
            }
            const auto& text = value.get_ref<const std::string&>();
            if (param.required && TextAnalysis::normalize_whitespace(text).empty()) {
                return "must not be empty";
            }
            if (param.max_length > 0 && text.size() > param.max_length) {
                return "longer than " + std::to_string(param.max_length) + " bytes";
            }
            return std::nullopt;
        }
        case ParamType::Integer:
            if (!value.is_number_integer()) {
                return "expected integer";
            }
            return std::nullopt;
        case ParamType::Number:
            if (!value.is_number()) {
                return "expected number";
            }
            return std::nullopt;
        case ParamType::Boolean:
            if (!value.is_boolean()) {
                return "expected boolean";
            }
            return std::nullopt;
        case ParamType::StringArray: {
            if (!value.is_array()) {
                return "expected array of strings";
            }
            if (param.max_items > 0 && value.size() > param.max_items) {
                return "more than " + std::to_string(param.max_items) + " items";
            }
            for (std::size_t i = 0; i < value.size(); ++i) {
                if (!value[i].is_string()) {
                    return "element " + std::to_string(i) + " is not a string";
                }
                if (param.max_length > 0 && value[i].get_ref<const std::string&>().size() > param.max_length) {
                    return "element " + std::to_string(i) + " is longer than " +
                           std::to_string(param.max_length) + " bytes";
                }
            }
            return std::nullopt;
        }
    }
    return std::string("unsupported parameter type");
}

} // namespace presence_mcp
