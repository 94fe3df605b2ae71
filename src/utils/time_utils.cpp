#include "utils/time_utils.hpp"
#include <ctime>
#include <fmt/format.h>

namespace gate {
namespace time_utils {

std::string to_iso8601(WallClock t) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch());
    std::time_t seconds = std::chrono::system_clock::to_time_t(t);
    int64_t millis = since_epoch.count() % 1000;
    if (millis < 0) millis += 1000;

    std::tm tm{};
    gmtime_r(&seconds, &tm);

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
}

std::string now_iso8601() {
    return to_iso8601(wall_now());
}

} // namespace time_utils
} // namespace gate
