#pragma once

#include "resource_provider.hpp"
#include "tool_registry.hpp"
#include <string>
#include <vector>

namespace debug_mcp {

/**
 * Routes tool calls and resource reads to the registered handlers.
 *
 * Protocol mismatches (unknown tool name or resource URI) are thrown as
 * UnknownToolError / UnknownResourceError. An exception escaping a handler
 * is converted into an error ToolResult here, so one bad call cannot take
 * the server down.
 */
class Dispatcher {
public:
    Dispatcher(const ToolRegistry& tools, const ResourceProvider& resources);

    const std::vector<ToolDescriptor>& list_tools() const { return tools_.list_tools(); }
    const std::vector<ResourceDescriptor>& list_resources() const { return resources_.list_resources(); }

    ToolResult call_tool(const std::string& name, const json& arguments) const;
    ResourceContent read_resource(const std::string& uri) const;

private:
    const ToolRegistry& tools_;
    const ResourceProvider& resources_;
};

} // namespace debug_mcp
