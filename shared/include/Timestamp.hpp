#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace catalog {

using Clock = std::function<std::chrono::system_clock::time_point()>;

// wall clock used outside of tests
Clock systemClock();

// local time as YYYY-MM-DDTHH:MM:SS.ffffff
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

} // namespace catalog
