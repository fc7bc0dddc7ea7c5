#ifndef DEBUG_MCP_SERVER_HPP
#define DEBUG_MCP_SERVER_HPP

#include "dispatcher.hpp"
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace debug_mcp {

// JSON-RPC 2.0 error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
constexpr int SERVER_NOT_INITIALIZED = -32002;

constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// MCP server over line-delimited JSON-RPC on standard I/O
class MCPServer {
public:
    MCPServer(const std::string& name, const std::string& version, const Dispatcher& dispatcher);

    // Reads one request per line until end of input
    void run_stdio();
    void run_stdio(std::istream& input, std::ostream& output);

    // Returns the response, or null for notifications
    json handle_message(const json& message);

    std::string get_name() const { return server_name_; }
    std::string get_version() const { return server_version_; }
    bool is_initialized() const { return initialized_; }

private:
    std::string server_name_;
    std::string server_version_;
    const Dispatcher& dispatcher_;

    bool initialized_;
    json client_info_;

    // Message handling
    json handle_initialize(const json& params);
    json handle_tools_list(const json& params);
    json handle_tools_call(const json& params);
    json handle_resources_list(const json& params);
    json handle_resources_read(const json& params);

    // Error responses
    json create_error_response(const json& id, int code, const std::string& message);
    json create_success_response(const json& id, const json& result);
};

} // namespace debug_mcp

#endif // DEBUG_MCP_SERVER_HPP
