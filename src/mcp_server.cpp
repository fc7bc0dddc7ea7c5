#include <debugmcp/mcp_server.hpp>
#include <debugmcp/logging.hpp>

namespace debug_mcp {

namespace {

// Bad params from the client, reported as INVALID_PARAMS
class InvalidParamsError : public std::runtime_error {
public:
    explicit InvalidParamsError(const std::string& message)
        : std::runtime_error(message) {}
};

std::string require_string(const json& params, const std::string& key) {
    if (!params.is_object() || !params.contains(key)) {
        throw InvalidParamsError("Missing '" + key + "' parameter");
    }
    if (!params[key].is_string()) {
        throw InvalidParamsError("Parameter '" + key + "' must be a string");
    }
    return params[key].get<std::string>();
}

} // namespace

MCPServer::MCPServer(const std::string& name, const std::string& version, const Dispatcher& dispatcher)
    : server_name_(name), server_version_(version), dispatcher_(dispatcher), initialized_(false) {
}

json MCPServer::create_error_response(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

json MCPServer::create_success_response(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

json MCPServer::handle_initialize(const json& params) {
    initialized_ = true;

    if (params.is_object() && params.contains("clientInfo")) {
        client_info_ = params["clientInfo"];
        logging::info("Client connected: " + client_info_.value("name", std::string("unknown"))
                      + " " + client_info_.value("version", std::string("")));
    }

    // MCP protocol requires capabilities to be objects, not booleans
    json capabilities = json::object();

    if (!dispatcher_.list_tools().empty()) {
        capabilities["tools"] = json::object();
    }

    if (!dispatcher_.list_resources().empty()) {
        capabilities["resources"] = {
            {"subscribe", false},
            {"listChanged", false}
        };
    }

    return {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", capabilities},
        {"serverInfo", {
            {"name", server_name_},
            {"version", server_version_}
        }}
    };
}

json MCPServer::handle_tools_list(const json&) {
    logging::info("Listing tools requested");
    json tools_array = json::array();

    for (const auto& tool : dispatcher_.list_tools()) {
        tools_array.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema()}
        });
    }

    return {{"tools", tools_array}};
}

json MCPServer::handle_tools_call(const json& params) {
    std::string tool_name = require_string(params, "name");
    json arguments = params.contains("arguments") ? params["arguments"] : json::object();

    return dispatcher_.call_tool(tool_name, arguments).to_json();
}

json MCPServer::handle_resources_list(const json&) {
    logging::info("Resources list requested");
    json resources_array = json::array();

    for (const auto& resource : dispatcher_.list_resources()) {
        resources_array.push_back({
            {"uri", resource.uri},
            {"name", resource.name},
            {"description", resource.description},
            {"mimeType", resource.mime_type}
        });
    }

    return {{"resources", resources_array}};
}

json MCPServer::handle_resources_read(const json& params) {
    std::string uri = require_string(params, "uri");
    ResourceContent content = dispatcher_.read_resource(uri);

    return {
        {"contents", json::array({
            {
                {"uri", content.uri},
                {"mimeType", content.mime_type},
                {"text", content.text}
            }
        })}
    };
}

json MCPServer::handle_message(const json& message) {
    json id = nullptr;
    bool is_notification = true;

    if (message.is_object() && message.contains("id")) {
        id = message["id"];
        is_notification = false;
    }

    try {
        // Validate JSON-RPC 2.0 message
        if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
            return create_error_response(id, INVALID_REQUEST, "Invalid JSON-RPC version");
        }

        if (!message.contains("method") || !message["method"].is_string()) {
            return create_error_response(id, INVALID_REQUEST, "Missing method");
        }

        std::string method = message["method"];
        json params = message.contains("params") ? message["params"] : json::object();

        if (is_notification) {
            logging::debug("Notification received: " + method);
            return nullptr;
        }

        if (method == "initialize") {
            return create_success_response(id, handle_initialize(params));
        }

        if (method == "ping") {
            return create_success_response(id, json::object());
        }

        // Check if initialized for other methods
        if (!initialized_) {
            return create_error_response(id, SERVER_NOT_INITIALIZED, "Server not initialized");
        }

        // Route to appropriate handler
        json result;
        if (method == "tools/list") {
            result = handle_tools_list(params);
        } else if (method == "tools/call") {
            result = handle_tools_call(params);
        } else if (method == "resources/list") {
            result = handle_resources_list(params);
        } else if (method == "resources/read") {
            result = handle_resources_read(params);
        } else {
            return create_error_response(id, METHOD_NOT_FOUND, "Method not found: " + method);
        }

        return create_success_response(id, result);

    } catch (const UnknownToolError& e) {
        return create_error_response(id, INVALID_PARAMS, e.what());
    } catch (const UnknownResourceError& e) {
        return create_error_response(id, INVALID_PARAMS, e.what());
    } catch (const InvalidParamsError& e) {
        return create_error_response(id, INVALID_PARAMS, e.what());
    } catch (const std::exception& e) {
        logging::error(std::string("Internal error: ") + e.what());
        return create_error_response(id, INTERNAL_ERROR, "Internal error: " + std::string(e.what()));
    }
}

void MCPServer::run_stdio() {
    run_stdio(std::cin, std::cout);
}

void MCPServer::run_stdio(std::istream& input, std::ostream& output) {
    logging::info("MCP server '" + server_name_ + "' " + server_version_ + " starting in STDIO mode");

    std::string line;
    while (std::getline(input, line)) {
        if (line.empty() || line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        json response;
        try {
            json request = json::parse(line);
            response = handle_message(request);
        } catch (const json::parse_error& e) {
            logging::error(std::string("JSON error: ") + e.what());
            response = create_error_response(nullptr, PARSE_ERROR, "Parse error");
        }

        if (!response.is_null()) {
            output << response.dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
            output.flush();
        }
    }

    logging::info("Input closed, leaving STDIO loop");
}

} // namespace debug_mcp
