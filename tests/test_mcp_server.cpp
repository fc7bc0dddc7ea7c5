// JSON-RPC handling of the stdio server
#include "test_support.hpp"
#include <debugmcp/logging.hpp>
#include <debugmcp/mcp_server.hpp>
#include <debugmcp/tool_handlers.hpp>
#include <sstream>

using namespace debug_mcp;

namespace {

struct Fixture {
    ServerConfig config;
    SharedOutboundSession session;
    ToolRegistry tools;
    ResourceProvider resources;
    Dispatcher dispatcher;
    MCPServer server;

    Fixture()
        : session(config.http)
        , dispatcher(tools, resources)
        , server(config.server_name, config.server_version, dispatcher) {
        register_default_tools(config, tools, resources, session);
    }

    json request(const json& id, const std::string& method, const json& params = json::object()) {
        return server.handle_message({
            {"jsonrpc", "2.0"},
            {"id", id},
            {"method", method},
            {"params", params}
        });
    }

    void initialize() {
        request(0, "initialize", {
            {"protocolVersion", PROTOCOL_VERSION},
            {"clientInfo", {{"name", "test-client"}, {"version", "1.0.0"}}}
        });
    }
};

bool test_requires_initialize() {
    Fixture fx;
    json response = fx.request(1, "tools/list");

    CHECK(response["error"]["code"] == SERVER_NOT_INITIALIZED);
    CHECK(!fx.server.is_initialized());

    // ping is allowed at any time
    json pong = fx.request(2, "ping");
    CHECK(pong["result"] == json::object());
    return true;
}

bool test_initialize_reports_capabilities() {
    Fixture fx;
    json response = fx.request(1, "initialize", {{"protocolVersion", PROTOCOL_VERSION}});

    CHECK(fx.server.is_initialized());
    json result = response["result"];
    CHECK(result["protocolVersion"] == PROTOCOL_VERSION);
    CHECK(result["serverInfo"]["name"] == "debug-mcp-server");
    CHECK(result["serverInfo"]["version"] == "0.1.0");
    CHECK(result["capabilities"]["tools"].is_object());
    CHECK(result["capabilities"]["resources"]["subscribe"] == false);
    return true;
}

bool test_tools_list() {
    Fixture fx;
    fx.initialize();
    json response = fx.request(2, "tools/list");

    json tools = response["result"]["tools"];
    CHECK(tools.size() == 4);
    CHECK(tools[0]["name"] == "debug_info");
    CHECK(tools[1]["name"] == "echo");
    CHECK(tools[2]["name"] == "fetch_api_data");
    CHECK(tools[3]["name"] == "weather_api");
    CHECK(tools[2]["inputSchema"]["required"] == json::array({"url"}));
    return true;
}

bool test_tools_call() {
    Fixture fx;
    fx.initialize();
    json response = fx.request("call-1", "tools/call", {
        {"name", "weather_api"},
        {"arguments", {{"city", "Paris"}}}
    });

    CHECK(response["id"] == "call-1");
    CHECK(response["result"]["isError"] == false);
    json content = response["result"]["content"];
    CHECK(content.size() == 1);
    CHECK(content[0]["type"] == "text");
    CHECK(json::parse(content[0]["text"].get<std::string>())["city"] == "Paris");
    return true;
}

bool test_unknown_tool_is_an_error_response() {
    Fixture fx;
    fx.initialize();
    json response = fx.request(7, "tools/call", {{"name", "nonexistent_tool"}, {"arguments", json::object()}});

    CHECK(!response.contains("result"));
    CHECK(response["id"] == 7);
    CHECK(response["error"]["code"] == INVALID_PARAMS);
    CHECK(response["error"]["message"] == "Unknown tool: nonexistent_tool");
    return true;
}

bool test_missing_params() {
    Fixture fx;
    fx.initialize();

    json no_name = fx.request(3, "tools/call", json::object());
    CHECK(no_name["error"]["code"] == INVALID_PARAMS);

    json no_uri = fx.request(4, "resources/read", json::object());
    CHECK(no_uri["error"]["code"] == INVALID_PARAMS);
    return true;
}

bool test_resources() {
    Fixture fx;
    fx.initialize();

    json listed = fx.request(5, "resources/list")["result"]["resources"];
    CHECK(listed.size() == 2);
    CHECK(listed[0]["uri"] == "config://settings");
    CHECK(listed[0]["mimeType"] == "application/json");

    json read = fx.request(6, "resources/read", {{"uri", "debug://logs"}});
    json contents = read["result"]["contents"];
    CHECK(contents[0]["uri"] == "debug://logs");
    CHECK(contents[0]["mimeType"] == "text/plain");

    json missing = fx.request(7, "resources/read", {{"uri", "file:///etc/passwd"}});
    CHECK(missing["error"]["code"] == INVALID_PARAMS);
    return true;
}

bool test_protocol_errors() {
    Fixture fx;
    fx.initialize();

    json bad_version = fx.server.handle_message({{"jsonrpc", "1.0"}, {"id", 1}, {"method", "ping"}});
    CHECK(bad_version["error"]["code"] == INVALID_REQUEST);

    json unknown = fx.request(2, "prompts/list");
    CHECK(unknown["error"]["code"] == METHOD_NOT_FOUND);

    json notification = fx.server.handle_message({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    CHECK(notification.is_null());
    return true;
}

bool test_stdio_loop() {
    Fixture fx;

    std::istringstream input(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        "\n"
        "this is not json\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hi"}}})" "\n");
    std::ostringstream output;

    fx.server.run_stdio(input, output);

    std::istringstream lines(output.str());
    std::vector<json> responses;
    std::string line;
    while (std::getline(lines, line)) {
        responses.push_back(json::parse(line));
    }

    CHECK(responses.size() == 3);
    CHECK(responses[0]["id"] == 1);
    CHECK(responses[1]["id"].is_null());
    CHECK(responses[1]["error"]["code"] == PARSE_ERROR);
    CHECK(responses[2]["id"] == 2);
    std::string text = responses[2]["result"]["content"][0]["text"];
    CHECK(text.rfind("Echo at ", 0) == 0);
    CHECK(text.size() >= 4 && text.compare(text.size() - 4, 4, ": hi") == 0);
    return true;
}

} // namespace

int main() {
    logging::set_level(logging::Level::ERROR);

    return test_support::run_tests("MCP server", {
        {"requires initialize", test_requires_initialize},
        {"initialize reports capabilities", test_initialize_reports_capabilities},
        {"tools/list", test_tools_list},
        {"tools/call", test_tools_call},
        {"unknown tool is an error response", test_unknown_tool_is_an_error_response},
        {"missing params", test_missing_params},
        {"resources", test_resources},
        {"protocol errors", test_protocol_errors},
        {"stdio loop", test_stdio_loop},
    });
}
