#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace debug_mcp {

// ==================== TOOL CONTRACT ====================

struct ToolParameter {
    std::string name;
    std::string type = "string";     // string, number, integer, boolean, object, array
    std::string description;
    bool required = true;
    json default_value;              // null when there is no default
    std::vector<std::string> enum_values;
    std::string value_type;          // element type of a string-keyed map ("object" only)
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;

    // JSON Schema advertised through tools/list
    json input_schema() const;
};

// ==================== RESULTS ====================

struct ContentBlock {
    std::string type = "text";
    std::string text;
};

struct ToolResult {
    std::vector<ContentBlock> content;
    bool is_error = false;

    static ToolResult text(const std::string& text);
    // Pretty-printed JSON in a single text block. Invalid UTF-8 is replaced.
    static ToolResult json_text(const json& data);
    static ToolResult error(const std::string& category, const std::string& message);

    json to_json() const;
};

// ==================== ERRORS ====================

class UnknownToolError : public std::runtime_error {
public:
    explicit UnknownToolError(const std::string& name)
        : std::runtime_error("Unknown tool: " + name), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// Thrown by resolve_arguments(); handlers turn it into an "Invalid Arguments" result.
class InvalidArgumentsError : public std::runtime_error {
public:
    explicit InvalidArgumentsError(const std::string& message)
        : std::runtime_error(message) {}
};

// ==================== HANDLERS ====================

class ToolHandler {
public:
    virtual ~ToolHandler() = default;
    virtual ToolResult execute(const json& arguments) = 0;
};

// ==================== REGISTRY ====================

class ToolRegistry {
public:
    // Throws std::logic_error on an empty or duplicate name, a null handler,
    // or when called after seal().
    void add(const ToolDescriptor& descriptor, std::unique_ptr<ToolHandler> handler);

    void seal() { sealed_ = true; }
    bool sealed() const { return sealed_; }

    // Registration order, stable for the process lifetime
    const std::vector<ToolDescriptor>& list_tools() const { return descriptors_; }
    std::vector<std::string> names() const;

    const ToolDescriptor* find_descriptor(const std::string& name) const;
    ToolHandler* find_handler(const std::string& name) const;

private:
    std::vector<ToolDescriptor> descriptors_;
    std::map<std::string, std::unique_ptr<ToolHandler>> handlers_;
    bool sealed_ = false;
};

// ==================== UTILITY FUNCTIONS ====================

// Convert JSON type string to actual type check
bool validate_parameter_type(const std::string& type_str, const json& value);

// Applies defaults and checks required parameters, types and enums against
// the descriptor. Unknown extra arguments are kept. Throws InvalidArgumentsError.
json resolve_arguments(const ToolDescriptor& descriptor, const json& arguments);

} // namespace debug_mcp
