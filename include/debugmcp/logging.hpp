#pragma once

#include <string>

namespace debug_mcp {
namespace logging {

enum class Level {
    DEBUG = 10,
    INFO = 20,
    WARNING = 30,
    ERROR = 40
};

// Parses "debug", "info", "warning"/"warn", "error" (any case).
// Throws std::invalid_argument for anything else.
Level parse_level(const std::string& text);
std::string level_name(Level level);

void set_level(Level level);
Level get_level();
bool is_enabled(Level level);

// Writes "<time> - <logger> - <LEVEL> - <message>" to stderr.
// stdout carries the protocol, so nothing here may touch it.
void log(Level level, const std::string& message);

void debug(const std::string& message);
void info(const std::string& message);
void warning(const std::string& message);
void error(const std::string& message);

} // namespace logging
} // namespace debug_mcp
