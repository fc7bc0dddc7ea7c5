#include <debugmcp/dispatcher.hpp>
#include <debugmcp/logging.hpp>

namespace debug_mcp {

Dispatcher::Dispatcher(const ToolRegistry& tools, const ResourceProvider& resources)
    : tools_(tools), resources_(resources) {}

ToolResult Dispatcher::call_tool(const std::string& name, const json& arguments) const {
    json args = arguments.is_null() ? json::object() : arguments;
    logging::info("Tool called: " + name + " with args: "
                  + args.dump(-1, ' ', false, json::error_handler_t::replace));

    ToolHandler* handler = tools_.find_handler(name);
    if (!handler) {
        logging::error("Unknown tool: " + name);
        throw UnknownToolError(name);
    }

    try {
        return handler->execute(args);
    } catch (const std::exception& e) {
        logging::error("Tool '" + name + "' failed: " + e.what());
        ToolResult result = ToolResult::json_text({
            {"error", "Unexpected Error"},
            {"message", e.what()},
            {"tool", name}
        });
        result.is_error = true;
        return result;
    } catch (...) {
        logging::error("Tool '" + name + "' failed: unknown error");
        ToolResult result = ToolResult::json_text({
            {"error", "Unexpected Error"},
            {"message", "unknown error"},
            {"tool", name}
        });
        result.is_error = true;
        return result;
    }
}

ResourceContent Dispatcher::read_resource(const std::string& uri) const {
    logging::info("Resource read requested: " + uri);
    try {
        return resources_.read(uri);
    } catch (const UnknownResourceError&) {
        logging::error("Unknown resource: " + uri);
        throw;
    }
}

} // namespace debug_mcp
