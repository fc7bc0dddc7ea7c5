#pragma once

#include "outbound_session.hpp"
#include "resource_provider.hpp"
#include "server_config.hpp"
#include "tool_registry.hpp"
#include <string>

namespace debug_mcp {

// ==================== TOOL HANDLERS ====================

class DebugInfoHandler : public ToolHandler {
public:
    DebugInfoHandler(std::string server_name, const ToolRegistry& tools,
                     const ResourceProvider& resources);

    static ToolDescriptor descriptor();
    ToolResult execute(const json& arguments) override;

private:
    std::string server_name_;
    const ToolRegistry& tools_;
    const ResourceProvider& resources_;
};

class EchoHandler : public ToolHandler {
public:
    static ToolDescriptor descriptor();
    ToolResult execute(const json& arguments) override;
};

/**
 * Generic HTTP proxy. Any response the remote server sends back, including
 * 4xx/5xx, is reported as data; transport failures are reported as an
 * "HTTP Client Error" object. Nothing is thrown to the dispatcher.
 */
class FetchApiDataHandler : public ToolHandler {
public:
    explicit FetchApiDataHandler(SharedOutboundSession& session);

    static ToolDescriptor descriptor();
    ToolResult execute(const json& arguments) override;

private:
    SharedOutboundSession& session_;
};

// Mock weather unless live mode and an API key are both configured
class WeatherApiHandler : public ToolHandler {
public:
    WeatherApiHandler(const WeatherOptions& options, SharedOutboundSession& session);

    static ToolDescriptor descriptor();
    ToolResult execute(const json& arguments) override;

private:
    json mock_weather(const std::string& city) const;
    json live_weather(const std::string& city);

    WeatherOptions options_;
    SharedOutboundSession& session_;
};

// ==================== DEFAULT SET ====================

// Registers debug_info, echo, fetch_api_data and weather_api (in that order)
// and the config://settings and debug://logs resources, then seals both.
void register_default_tools(const ServerConfig& config,
                            ToolRegistry& tools,
                            ResourceProvider& resources,
                            SharedOutboundSession& session);

} // namespace debug_mcp
