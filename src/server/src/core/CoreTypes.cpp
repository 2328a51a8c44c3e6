#include "core/CoreTypes.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace NearbyConnect {

std::string toIso8601(Timestamp t) {
    const int64_t ms = toUnixMillis(t);
    int64_t seconds = ms / 1000;
    int64_t millis = ms % 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    auto time = static_cast<std::time_t>(seconds);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

} // namespace NearbyConnect
