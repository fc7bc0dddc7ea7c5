#pragma once

#include "logging.hpp"
#include "outbound_session.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace debug_mcp {

// ==================== CONFIGURATION STRUCTURES ====================

struct WeatherOptions {
    bool live = false;               // mock data unless explicitly enabled
    std::string api_key;             // never compiled in; config file or environment only
    std::string base_url = "https://api.openweathermap.org/data/2.5/weather";

    bool live_enabled() const { return live && !api_key.empty(); }
};

struct ServerConfig {
    std::string server_name = "debug-mcp-server";
    std::string server_version = "0.1.0";
    SessionOptions http;
    WeatherOptions weather;
    logging::Level log_level = logging::Level::INFO;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

// Returns the value of an environment variable, or nullptr when unset
using EnvLookup = std::function<const char*(const std::string&)>;

// ==================== CONFIGURATION LOADER ====================

class ConfigLoader {
public:
    explicit ConfigLoader(const std::string& config_path = "");

    // Defaults, then the config file (if a path was given), then the
    // environment. Throws ConfigError.
    ServerConfig load() const;
    ServerConfig load(const EnvLookup& env) const;

    static void apply_json(ServerConfig& config, const json& document);
    static void apply_environment(ServerConfig& config, const EnvLookup& env);

    static EnvLookup system_environment();

private:
    std::string config_path_;
};

// "1", "true", "yes", "on" / "0", "false", "no", "off" (any case). Throws ConfigError.
bool parse_bool(const std::string& name, const std::string& value);
long parse_positive_long(const std::string& name, const std::string& value);

} // namespace debug_mcp
