#include <debugmcp/tool_registry.hpp>
#include <algorithm>

namespace debug_mcp {

// ==================== TOOL CONTRACT ====================

json ToolDescriptor::input_schema() const {
    json properties = json::object();
    json required = json::array();

    for (const auto& param : parameters) {
        json param_schema = {
            {"type", param.type},
            {"description", param.description}
        };

        if (!param.enum_values.empty()) {
            param_schema["enum"] = param.enum_values;
        }

        if (!param.default_value.is_null()) {
            param_schema["default"] = param.default_value;
        }

        if (!param.value_type.empty()) {
            param_schema["additionalProperties"] = {{"type", param.value_type}};
        }

        properties[param.name] = param_schema;

        if (param.required && param.default_value.is_null()) {
            required.push_back(param.name);
        }
    }

    json schema = {
        {"type", "object"},
        {"properties", properties}
    };

    if (!required.empty()) {
        schema["required"] = required;
    }

    if (parameters.empty()) {
        schema["additionalProperties"] = false;
    }

    return schema;
}

// ==================== RESULTS ====================

ToolResult ToolResult::text(const std::string& text) {
    ToolResult result;
    result.content.push_back(ContentBlock{"text", text});
    return result;
}

ToolResult ToolResult::json_text(const json& data) {
    return text(data.dump(2, ' ', false, json::error_handler_t::replace));
}

ToolResult ToolResult::error(const std::string& category, const std::string& message) {
    ToolResult result = json_text({
        {"error", category},
        {"message", message}
    });
    result.is_error = true;
    return result;
}

json ToolResult::to_json() const {
    json blocks = json::array();
    for (const auto& block : content) {
        blocks.push_back({
            {"type", block.type},
            {"text", block.text}
        });
    }

    return {
        {"content", blocks},
        {"isError", is_error}
    };
}

// ==================== REGISTRY ====================

void ToolRegistry::add(const ToolDescriptor& descriptor, std::unique_ptr<ToolHandler> handler) {
    if (sealed_) {
        throw std::logic_error("Tool registry is sealed, cannot add: " + descriptor.name);
    }
    if (descriptor.name.empty()) {
        throw std::logic_error("Tool name must not be empty");
    }
    if (!handler) {
        throw std::logic_error("Tool has no handler: " + descriptor.name);
    }
    if (handlers_.count(descriptor.name)) {
        throw std::logic_error("Tool already registered: " + descriptor.name);
    }

    descriptors_.push_back(descriptor);
    handlers_[descriptor.name] = std::move(handler);
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(descriptors_.size());
    for (const auto& descriptor : descriptors_) {
        result.push_back(descriptor.name);
    }
    return result;
}

const ToolDescriptor* ToolRegistry::find_descriptor(const std::string& name) const {
    auto it = std::find_if(descriptors_.begin(), descriptors_.end(),
        [&name](const ToolDescriptor& d) { return d.name == name; });
    return it == descriptors_.end() ? nullptr : &*it;
}

ToolHandler* ToolRegistry::find_handler(const std::string& name) const {
    auto it = handlers_.find(name);
    return it == handlers_.end() ? nullptr : it->second.get();
}

// ==================== UTILITY FUNCTIONS ====================

bool validate_parameter_type(const std::string& type_str, const json& value) {
    if (type_str == "string" || type_str == "str") {
        return value.is_string();
    } else if (type_str == "integer" || type_str == "int") {
        return value.is_number_integer();
    } else if (type_str == "float" || type_str == "double" || type_str == "number") {
        return value.is_number();
    } else if (type_str == "boolean" || type_str == "bool") {
        return value.is_boolean();
    } else if (type_str == "object") {
        return value.is_object();
    } else if (type_str == "array") {
        return value.is_array();
    }
    return true; // Allow any type if not specified
}

json resolve_arguments(const ToolDescriptor& descriptor, const json& arguments) {
    if (!arguments.is_null() && !arguments.is_object()) {
        throw InvalidArgumentsError("Arguments must be an object");
    }

    json params = arguments.is_null() ? json::object() : arguments;

    for (const auto& param : descriptor.parameters) {
        if (!params.contains(param.name) || params[param.name].is_null()) {
            if (!param.default_value.is_null()) {
                params[param.name] = param.default_value;
            } else if (param.required) {
                throw InvalidArgumentsError("Missing required parameter: " + param.name);
            } else {
                params.erase(param.name);
            }
            continue;
        }

        const json& value = params[param.name];
        if (!validate_parameter_type(param.type, value)) {
            throw InvalidArgumentsError("Parameter '" + param.name + "' must be of type " + param.type);
        }

        if (!param.enum_values.empty()) {
            std::string str_val = value.get<std::string>();
            if (std::find(param.enum_values.begin(), param.enum_values.end(), str_val)
                    == param.enum_values.end()) {
                throw InvalidArgumentsError("Parameter '" + param.name + "' has unsupported value: " + str_val);
            }
        }
    }

    return params;
}

} // namespace debug_mcp
