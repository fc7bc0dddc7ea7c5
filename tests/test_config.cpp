// Configuration layering: defaults, file, environment
#include "test_support.hpp"
#include <debugmcp/server_config.hpp>
#include <cstdio>
#include <fstream>
#include <map>

using namespace debug_mcp;

namespace {

EnvLookup fake_environment(const std::map<std::string, std::string>& values) {
    return [values](const std::string& name) -> const char* {
        auto it = values.find(name);
        return it == values.end() ? nullptr : it->second.c_str();
    };
}

bool test_safe_defaults() {
    ServerConfig config = ConfigLoader().load(fake_environment({}));

    CHECK(config.server_name == "debug-mcp-server");
    CHECK(config.server_version == "0.1.0");
    CHECK(config.http.timeout_seconds == 30);
    CHECK(config.http.verify_tls);
    CHECK(!config.weather.live);
    CHECK(config.weather.api_key.empty());
    CHECK(!config.weather.live_enabled());
    CHECK(config.log_level == logging::Level::INFO);
    return true;
}

bool test_json_overrides() {
    ServerConfig config;
    ConfigLoader::apply_json(config, {
        {"server", {{"name", "staging-server"}}},
        {"http", {{"timeout_seconds", 5}, {"verify_tls", false}}},
        {"weather", {{"live", true}, {"api_key", "k-123"}}},
        {"log", {{"level", "debug"}}}
    });

    CHECK(config.server_name == "staging-server");
    CHECK(config.server_version == "0.1.0");
    CHECK(config.http.timeout_seconds == 5);
    CHECK(!config.http.verify_tls);
    CHECK(config.weather.live_enabled());
    CHECK(config.log_level == logging::Level::DEBUG);
    return true;
}

bool test_json_rejects_bad_values() {
    auto rejects = [](const json& document) {
        ServerConfig config;
        try {
            ConfigLoader::apply_json(config, document);
        } catch (const ConfigError&) {
            return true;
        }
        return false;
    };

    CHECK(rejects(json::array()));
    CHECK(rejects({{"http", {{"timeout_seconds", "thirty"}}}}));
    CHECK(rejects({{"http", {{"timeout_seconds", 0}}}}));
    CHECK(rejects({{"log", {{"level", "chatty"}}}}));
    return true;
}

bool test_environment_overrides() {
    ServerConfig config;
    ConfigLoader::apply_environment(config, fake_environment({
        {"DEBUG_MCP_HTTP_TIMEOUT", "12"},
        {"DEBUG_MCP_VERIFY_TLS", "off"},
        {"DEBUG_MCP_WEATHER_LIVE", "YES"},
        {"DEBUG_MCP_WEATHER_API_KEY", "env-key"},
        {"DEBUG_MCP_LOG_LEVEL", "warning"}
    }));

    CHECK(config.http.timeout_seconds == 12);
    CHECK(!config.http.verify_tls);
    CHECK(config.weather.live);
    CHECK(config.weather.api_key == "env-key");
    CHECK(config.log_level == logging::Level::WARNING);
    return true;
}

bool test_environment_rejects_bad_values() {
    auto rejects = [](const std::map<std::string, std::string>& values) {
        ServerConfig config;
        try {
            ConfigLoader::apply_environment(config, fake_environment(values));
        } catch (const ConfigError&) {
            return true;
        }
        return false;
    };

    CHECK(rejects({{"DEBUG_MCP_VERIFY_TLS", "maybe"}}));
    CHECK(rejects({{"DEBUG_MCP_HTTP_TIMEOUT", "-3"}}));
    CHECK(rejects({{"DEBUG_MCP_HTTP_TIMEOUT", "10s"}}));
    CHECK(rejects({{"DEBUG_MCP_LOG_LEVEL", "loud"}}));
    return true;
}

bool test_file_then_environment() {
    std::string path = "debug_mcp_test_config.json";
    {
        std::ofstream file(path);
        file << R"({"http": {"timeout_seconds": 7, "verify_tls": false}, "weather": {"api_key": "file-key"}})";
    }

    ServerConfig config = ConfigLoader(path).load(fake_environment({
        {"DEBUG_MCP_WEATHER_API_KEY", "env-key"}
    }));
    std::remove(path.c_str());

    CHECK(config.http.timeout_seconds == 7);
    CHECK(!config.http.verify_tls);
    CHECK(config.weather.api_key == "env-key");
    return true;
}

bool test_missing_or_broken_file() {
    bool missing_rejected = false;
    try {
        ConfigLoader("/nonexistent/debug_mcp.json").load(fake_environment({}));
    } catch (const ConfigError&) {
        missing_rejected = true;
    }
    CHECK(missing_rejected);

    std::string path = "debug_mcp_broken_config.json";
    {
        std::ofstream file(path);
        file << "{ not json";
    }
    bool broken_rejected = false;
    try {
        ConfigLoader(path).load(fake_environment({}));
    } catch (const ConfigError&) {
        broken_rejected = true;
    }
    std::remove(path.c_str());
    CHECK(broken_rejected);
    return true;
}

bool test_log_levels() {
    CHECK(logging::parse_level("DEBUG") == logging::Level::DEBUG);
    CHECK(logging::parse_level("warn") == logging::Level::WARNING);
    CHECK(logging::level_name(logging::Level::ERROR) == "ERROR");

    logging::set_level(logging::Level::WARNING);
    CHECK(!logging::is_enabled(logging::Level::INFO));
    CHECK(logging::is_enabled(logging::Level::ERROR));
    logging::set_level(logging::Level::INFO);
    return true;
}

} // namespace

int main() {
    return test_support::run_tests("config", {
        {"safe defaults", test_safe_defaults},
        {"JSON overrides", test_json_overrides},
        {"JSON rejects bad values", test_json_rejects_bad_values},
        {"environment overrides", test_environment_overrides},
        {"environment rejects bad values", test_environment_rejects_bad_values},
        {"file then environment", test_file_then_environment},
        {"missing or broken file", test_missing_or_broken_file},
        {"log levels", test_log_levels},
    });
}
