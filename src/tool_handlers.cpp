#include <debugmcp/tool_handlers.hpp>
#include <debugmcp/logging.hpp>
#include <debugmcp/timestamp.hpp>
#include <cmath>
#include <sstream>

namespace debug_mcp {

// ==================== DEBUG INFO ====================

DebugInfoHandler::DebugInfoHandler(std::string server_name, const ToolRegistry& tools,
                                   const ResourceProvider& resources)
    : server_name_(std::move(server_name)), tools_(tools), resources_(resources) {}

ToolDescriptor DebugInfoHandler::descriptor() {
    return {"debug_info", "Get server debug information", {}};
}

ToolResult DebugInfoHandler::execute(const json&) {
    json debug_data = {
        {"server_name", server_name_},
        {"timestamp", utc_timestamp()},
        {"tools_available", tools_.names()},
        {"resources_available", resources_.uris()},
        {"status", "running"}
    };
    return ToolResult::json_text(debug_data);
}

// ==================== ECHO ====================

ToolDescriptor EchoHandler::descriptor() {
    ToolParameter message;
    message.name = "message";
    message.description = "Message to echo back";

    return {"echo", "Echo back the input with timestamp and debug info", {message}};
}

ToolResult EchoHandler::execute(const json& arguments) {
    json params;
    try {
        params = resolve_arguments(descriptor(), arguments);
    } catch (const InvalidArgumentsError& e) {
        return ToolResult::error("Invalid Arguments", e.what());
    }

    std::string response = "Echo at " + utc_timestamp() + ": " + params["message"].get<std::string>();
    logging::info("Echo response: " + response);
    return ToolResult::text(response);
}

// ==================== WEATHER ====================

WeatherApiHandler::WeatherApiHandler(const WeatherOptions& options, SharedOutboundSession& session)
    : options_(options), session_(session) {}

ToolDescriptor WeatherApiHandler::descriptor() {
    ToolParameter city;
    city.name = "city";
    city.description = "City name";

    return {"weather_api", "Get weather information for a city", {city}};
}

ToolResult WeatherApiHandler::execute(const json& arguments) {
    json params;
    try {
        params = resolve_arguments(descriptor(), arguments);
    } catch (const InvalidArgumentsError& e) {
        return ToolResult::error("Invalid Arguments", e.what());
    }

    std::string city = params["city"].get<std::string>();
    logging::info("Weather data requested for " + city);

    if (!options_.live_enabled()) {
        return ToolResult::json_text(mock_weather(city));
    }

    try {
        return ToolResult::json_text(live_weather(city));
    } catch (const std::exception& e) {
        logging::error(std::string("Weather API error: ") + e.what());
        return ToolResult::json_text({
            {"error", "Weather API Error"},
            {"message", e.what()},
            {"city", city}
        });
    }
}

json WeatherApiHandler::mock_weather(const std::string& city) const {
    return {
        {"city", city},
        {"temperature", "22°C"},
        {"description", "Partly cloudy"},
        {"humidity", "65%"},
        {"wind_speed", "10 km/h"},
        {"note", "This is mock data. Configure weather.live and an API key for actual data."}
    };
}

json WeatherApiHandler::live_weather(const std::string& city) {
    HttpRequest request;
    request.method = "GET";
    request.url = options_.base_url
        + "?q=" + OutboundSession::url_encode(city)
        + "&appid=" + OutboundSession::url_encode(options_.api_key)
        + "&units=metric";
    request.headers["Accept"] = "application/json";

    HttpResponse response = session_.acquire()->perform(request);
    if (response.status_code < 200 || response.status_code >= 300) {
        throw std::runtime_error("Weather service returned status " + std::to_string(response.status_code));
    }

    json payload = json::parse(response.body);

    double temperature = payload.at("main").at("temp").get<double>();
    int humidity = payload.at("main").at("humidity").get<int>();
    double wind_ms = payload.at("wind").at("speed").get<double>();
    std::string description = payload.at("weather").at(0).at("description").get<std::string>();

    std::ostringstream temp_text;
    temp_text << std::lround(temperature) << "°C";
    std::ostringstream wind_text;
    wind_text << std::lround(wind_ms * 3.6) << " km/h";

    return {
        {"city", payload.value("name", city)},
        {"temperature", temp_text.str()},
        {"description", description},
        {"humidity", std::to_string(humidity) + "%"},
        {"wind_speed", wind_text.str()},
        {"note", "Live data from OpenWeatherMap"}
    };
}

// ==================== DEFAULT SET ====================

void register_default_tools(const ServerConfig& config,
                            ToolRegistry& tools,
                            ResourceProvider& resources,
                            SharedOutboundSession& session) {
    tools.add(DebugInfoHandler::descriptor(),
              std::make_unique<DebugInfoHandler>(config.server_name, tools, resources));
    tools.add(EchoHandler::descriptor(), std::make_unique<EchoHandler>());
    tools.add(FetchApiDataHandler::descriptor(), std::make_unique<FetchApiDataHandler>(session));
    tools.add(WeatherApiHandler::descriptor(),
              std::make_unique<WeatherApiHandler>(config.weather, session));
    tools.seal();

    bool debug_enabled = config.log_level == logging::Level::DEBUG;

    resources.add(
        {"config://settings", "Application Settings", "Current application configuration", "application/json"},
        [debug_enabled]() -> std::string {
            json settings = {
                {"version", "1.0"},
                {"debug", debug_enabled},
                {"last_updated", utc_timestamp()}
            };
            return settings.dump(2);
        }
    );

    resources.add(
        {"debug://logs", "Debug Logs", "Recent server logs", "text/plain"},
        []() -> std::string {
            return "Debug logs as of " + utc_timestamp() + "\nServer is running normally.";
        }
    );
    resources.seal();

    if (config.weather.live && config.weather.api_key.empty()) {
        logging::warning("weather.live is set but no API key is configured; serving mock weather data");
    }
}

} // namespace debug_mcp
