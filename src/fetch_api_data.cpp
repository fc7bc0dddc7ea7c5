#include <debugmcp/tool_handlers.hpp>
#include <debugmcp/logging.hpp>
#include <algorithm>
#include <cctype>
#include <iterator>

namespace debug_mcp {

// Names must be non-empty without ':'; neither part may break the header line
static bool is_valid_header(const std::string& name, const std::string& value) {
    static const char forbidden[] = {'\r', '\n', '\0'};
    auto clean = [](const std::string& text) {
        return std::none_of(text.begin(), text.end(), [](char c) {
            return std::find(std::begin(forbidden), std::end(forbidden), c) != std::end(forbidden);
        });
    };
    return !name.empty() && name.find(':') == std::string::npos && clean(name) && clean(value);
}

FetchApiDataHandler::FetchApiDataHandler(SharedOutboundSession& session)
    : session_(session) {}

ToolDescriptor FetchApiDataHandler::descriptor() {
    ToolParameter url;
    url.name = "url";
    url.description = "API endpoint URL";

    ToolParameter method;
    method.name = "method";
    method.description = "HTTP method";
    method.required = false;
    method.default_value = "GET";
    method.enum_values = {"GET", "POST", "PUT", "DELETE"};

    ToolParameter headers;
    headers.name = "headers";
    headers.type = "object";
    headers.description = "Optional HTTP headers";
    headers.required = false;
    headers.value_type = "string";

    ToolParameter body;
    body.name = "body";
    body.description = "Request body (for POST/PUT)";
    body.required = false;

    return {"fetch_api_data", "Fetch data from a REST API endpoint", {url, method, headers, body}};
}

ToolResult FetchApiDataHandler::execute(const json& arguments) {
    std::string url;
    std::string method = "GET";

    try {
        json params = arguments;
        if (params.is_object() && params.contains("method") && params["method"].is_string()) {
            std::string raw = params["method"].get<std::string>();
            std::transform(raw.begin(), raw.end(), raw.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            params["method"] = raw;
        }

        try {
            params = resolve_arguments(descriptor(), params);
        } catch (const InvalidArgumentsError& e) {
            logging::error(std::string("fetch_api_data: ") + e.what());
            return ToolResult::error("Invalid Arguments", e.what());
        }

        url = params["url"].get<std::string>();
        method = params["method"].get<std::string>();

        if (url.empty()) {
            return ToolResult::error("Invalid Arguments", "Parameter 'url' must not be empty");
        }

        HttpRequest request;
        request.method = method;
        request.url = url;

        if (params.contains("headers")) {
            for (auto& [key, value] : params["headers"].items()) {
                std::string header_value = value.is_string() ? value.get<std::string>() : value.dump();
                if (!is_valid_header(key, header_value)) {
                    logging::error("fetch_api_data: rejected header " + json(key).dump());
                    return ToolResult::error("Invalid Arguments",
                                             "Header '" + key + "' contains a line break, NUL or misplaced ':'");
                }
                request.headers[key] = header_value;
            }
        }

        // Prepare the payload
        std::string body = params.value("body", "");
        if (!body.empty() && (method == "POST" || method == "PUT")) {
            request.body = body;
            request.has_body = true;
            if (!request.headers.count("Content-Type")) {
                request.headers["Content-Type"] = "application/json";
            }
        }

        std::shared_ptr<OutboundSession> session = session_.acquire();

        logging::info("Making " + method + " request to " + url);
        HttpResponse response = session->perform(request);

        json response_headers = json::object();
        for (const auto& [name, value] : response.headers) {
            response_headers[name] = value;
        }

        json result = {
            {"status_code", response.status_code},
            {"headers", response_headers},
            {"body", response.body},
            {"url", response.url},
            {"method", method}
        };

        logging::info("API call completed with status " + std::to_string(response.status_code));
        return ToolResult::json_text(result);

    } catch (const HttpClientError& e) {
        logging::error(std::string("HTTP client error: ") + e.what());
        return ToolResult::json_text({
            {"error", "HTTP Client Error"},
            {"message", e.what()},
            {"url", url},
            {"method", method}
        });
    } catch (const std::exception& e) {
        logging::error(std::string("Unexpected error during API call: ") + e.what());
        return ToolResult::json_text({
            {"error", "Unexpected Error"},
            {"message", e.what()},
            {"url", url},
            {"method", method}
        });
    } catch (...) {
        logging::error("Unexpected error during API call: unknown error");
        return ToolResult::json_text({
            {"error", "Unexpected Error"},
            {"message", "unknown error"},
            {"url", url},
            {"method", method}
        });
    }
}

} // namespace debug_mcp
