#include <debugmcp/timestamp.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace debug_mcp {

std::string utc_timestamp() {
    return utc_timestamp(std::chrono::system_clock::now());
}

std::string utc_timestamp(std::chrono::system_clock::time_point when) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        when.time_since_epoch()).count() % 1000000;

    std::tm utc_time{};
    gmtime_r(&seconds, &utc_time);

    std::ostringstream out;
    out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros;
    return out.str();
}

} // namespace debug_mcp
