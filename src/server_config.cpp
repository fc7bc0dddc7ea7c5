#include <debugmcp/server_config.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace debug_mcp {

static std::string to_lower(const std::string& input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool parse_bool(const std::string& name, const std::string& value) {
    std::string normalized = to_lower(value);
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw ConfigError(name + ": expected a boolean, got '" + value + "'");
}

long parse_positive_long(const std::string& name, const std::string& value) {
    size_t consumed = 0;
    long result = 0;
    try {
        result = std::stol(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(name + ": expected a positive integer, got '" + value + "'");
    }
    if (consumed != value.size() || result <= 0) {
        throw ConfigError(name + ": expected a positive integer, got '" + value + "'");
    }
    return result;
}

// ==================== CONFIG LOADER ====================

ConfigLoader::ConfigLoader(const std::string& config_path)
    : config_path_(config_path) {}

ServerConfig ConfigLoader::load() const {
    return load(system_environment());
}

ServerConfig ConfigLoader::load(const EnvLookup& env) const {
    ServerConfig config;

    if (!config_path_.empty()) {
        std::ifstream file(config_path_);
        if (!file.is_open()) {
            throw ConfigError("Failed to open config file: " + config_path_);
        }

        json document;
        try {
            file >> document;
        } catch (const json::parse_error& e) {
            throw ConfigError("Failed to parse config file " + config_path_ + ": " + e.what());
        }

        apply_json(config, document);
        logging::debug("Loaded configuration from " + config_path_);
    }

    apply_environment(config, env);
    return config;
}

void ConfigLoader::apply_json(ServerConfig& config, const json& document) {
    if (!document.is_object()) {
        throw ConfigError("Configuration root must be an object");
    }

    try {
        if (document.contains("server")) {
            const json& server = document.at("server");
            config.server_name = server.value("name", config.server_name);
            config.server_version = server.value("version", config.server_version);
        }

        if (document.contains("http")) {
            const json& http = document.at("http");
            config.http.timeout_seconds = http.value("timeout_seconds", config.http.timeout_seconds);
            config.http.verify_tls = http.value("verify_tls", config.http.verify_tls);
            config.http.max_redirects = http.value("max_redirects", config.http.max_redirects);
            config.http.user_agent = http.value("user_agent", config.http.user_agent);
            if (config.http.timeout_seconds <= 0) {
                throw ConfigError("http.timeout_seconds must be positive");
            }
        }

        if (document.contains("weather")) {
            const json& weather = document.at("weather");
            config.weather.live = weather.value("live", config.weather.live);
            config.weather.api_key = weather.value("api_key", config.weather.api_key);
            config.weather.base_url = weather.value("base_url", config.weather.base_url);
        }

        if (document.contains("log") && document.at("log").contains("level")) {
            config.log_level = logging::parse_level(document.at("log").at("level").get<std::string>());
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
}

void ConfigLoader::apply_environment(ServerConfig& config, const EnvLookup& env) {
    auto lookup = [&env](const std::string& name) -> const char* {
        const char* value = env(name);
        return (value != nullptr && value[0] != '\0') ? value : nullptr;
    };

    if (const char* value = lookup("DEBUG_MCP_HTTP_TIMEOUT")) {
        config.http.timeout_seconds = parse_positive_long("DEBUG_MCP_HTTP_TIMEOUT", value);
    }
    if (const char* value = lookup("DEBUG_MCP_VERIFY_TLS")) {
        config.http.verify_tls = parse_bool("DEBUG_MCP_VERIFY_TLS", value);
    }
    if (const char* value = lookup("DEBUG_MCP_WEATHER_LIVE")) {
        config.weather.live = parse_bool("DEBUG_MCP_WEATHER_LIVE", value);
    }
    if (const char* value = lookup("DEBUG_MCP_WEATHER_API_KEY")) {
        config.weather.api_key = value;
    }
    if (const char* value = lookup("DEBUG_MCP_LOG_LEVEL")) {
        try {
            config.log_level = logging::parse_level(value);
        } catch (const std::invalid_argument& e) {
            throw ConfigError(std::string("DEBUG_MCP_LOG_LEVEL: ") + e.what());
        }
    }
}

EnvLookup ConfigLoader::system_environment() {
    return [](const std::string& name) -> const char* {
        return std::getenv(name.c_str());
    };
}

} // namespace debug_mcp
