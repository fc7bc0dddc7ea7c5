/*
 * Debug MCP Server
 * ================
 * Exposes debug_info, echo, fetch_api_data and weather_api tools plus two
 * read-only resources over line-delimited JSON-RPC on stdin/stdout.
 *
 * Usage:
 *   ./debug_mcp_server
 *   ./debug_mcp_server --config server_config.json --log-level debug
 */

#include <debugmcp/logging.hpp>
#include <debugmcp/mcp_server.hpp>
#include <debugmcp/server_config.hpp>
#include <debugmcp/tool_handlers.hpp>
#include <iostream>
#include <string>

using namespace debug_mcp;

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config FILE       Path to JSON configuration file\n"
              << "  --log-level LEVEL   debug, info, warning or error (default: info)\n"
              << "  --timeout SEC       Total timeout for outbound HTTP requests (default: 30)\n"
              << "  --insecure          Disable TLS certificate verification for outbound requests\n"
              << "  --help              Show this help message\n\n"
              << "Environment:\n"
              << "  DEBUG_MCP_LOG_LEVEL, DEBUG_MCP_HTTP_TIMEOUT, DEBUG_MCP_VERIFY_TLS,\n"
              << "  DEBUG_MCP_WEATHER_LIVE, DEBUG_MCP_WEATHER_API_KEY\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    // Parse command line arguments
    std::string config_path;
    std::string log_level;
    std::string timeout;
    bool insecure = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        }
        else if (arg == "--timeout" && i + 1 < argc) {
            timeout = argv[++i];
        }
        else if (arg == "--insecure") {
            insecure = true;
        }
        else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    ServerConfig config;
    try {
        config = ConfigLoader(config_path).load();

        if (!log_level.empty()) {
            config.log_level = logging::parse_level(log_level);
        }
        if (!timeout.empty()) {
            config.http.timeout_seconds = parse_positive_long("--timeout", timeout);
        }
        if (insecure) {
            config.http.verify_tls = false;
        }
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    logging::set_level(config.log_level);
    logging::info("Starting " + config.server_name + " " + config.server_version);

    if (!config.http.verify_tls) {
        logging::warning("TLS certificate verification is DISABLED for outbound requests");
    }
    if (config.weather.live_enabled()) {
        logging::info("weather_api uses live data from " + config.weather.base_url);
    }

    try {
        // Closed exactly once when this scope unwinds, whatever the exit path
        SharedOutboundSession http_session(config.http);

        ToolRegistry tools;
        ResourceProvider resources;
        register_default_tools(config, tools, resources, http_session);

        Dispatcher dispatcher(tools, resources);
        MCPServer server(config.server_name, config.server_version, dispatcher);

        server.run_stdio();

        http_session.shutdown();
    } catch (const std::exception& e) {
        logging::error(std::string("Server error: ") + e.what());
        return 1;
    }

    logging::info("Server stopped");
    return 0;
}
