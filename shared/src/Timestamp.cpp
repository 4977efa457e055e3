#include "Timestamp.hpp"
#include <ctime>
#include <cstdio>

namespace catalog {

Clock systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto sinceEpoch = tp.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(sinceEpoch - seconds);
    if (micros.count() < 0) {
        // pre-epoch times round toward the earlier second
        seconds -= std::chrono::seconds(1);
        micros += std::chrono::seconds(1);
    }

    std::time_t t = static_cast<std::time_t>(seconds.count());
    std::tm local{};
    localtime_r(&t, &local);

    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld",
                  local.tm_year + 1900, local.tm_mon + 1, local.tm_mday,
                  local.tm_hour, local.tm_min, local.tm_sec,
                  static_cast<long long>(micros.count()));
    return buffer;
}

} // namespace catalog
