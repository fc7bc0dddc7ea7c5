#include <debugmcp/logging.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace debug_mcp {
namespace logging {

static const char* LOGGER_NAME = "debug-mcp-server";

static std::atomic<int> current_level{static_cast<int>(Level::INFO)};
static std::mutex output_mutex;

static std::string to_lower(const std::string& input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

static std::string format_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local_time{};
    localtime_r(&seconds, &local_time);

    std::ostringstream out;
    out << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S")
        << ',' << std::setw(3) << std::setfill('0') << millis;
    return out.str();
}

Level parse_level(const std::string& text) {
    std::string name = to_lower(text);
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warning" || name == "warn") return Level::WARNING;
    if (name == "error") return Level::ERROR;
    throw std::invalid_argument("Unknown log level: " + text);
}

std::string level_name(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO";
        case Level::WARNING: return "WARNING";
        case Level::ERROR: return "ERROR";
    }
    return "INFO";
}

void set_level(Level level) {
    current_level = static_cast<int>(level);
}

Level get_level() {
    return static_cast<Level>(current_level.load());
}

bool is_enabled(Level level) {
    return static_cast<int>(level) >= current_level.load();
}

void log(Level level, const std::string& message) {
    if (!is_enabled(level)) {
        return;
    }
    std::string line = format_now() + " - " + LOGGER_NAME + " - " + level_name(level) + " - " + message;

    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << line << std::endl;
}

void debug(const std::string& message) { log(Level::DEBUG, message); }
void info(const std::string& message) { log(Level::INFO, message); }
void warning(const std::string& message) { log(Level::WARNING, message); }
void error(const std::string& message) { log(Level::ERROR, message); }

} // namespace logging
} // namespace debug_mcp
