#pragma once

#include <chrono>
#include <string>

namespace debug_mcp {

// ISO-8601 UTC with microseconds and no zone suffix, e.g. 2026-10-19T08:15:30.123456
std::string utc_timestamp();
std::string utc_timestamp(std::chrono::system_clock::time_point when);

} // namespace debug_mcp
