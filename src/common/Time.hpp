#pragma once

#include <chrono>
#include <cstdint>

using Clock = std::chrono::system_clock;
using Time = Clock::time_point;
using Millis = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;

// Actor state stores timestamps as integral milliseconds since the epoch.
[[nodiscard]] inline int64_t epoch_millis(const Time time) noexcept {
    return std::chrono::duration_cast<Millis>(time.time_since_epoch()).count();
}

[[nodiscard]] inline Time from_epoch_millis(const int64_t millis) noexcept {
    return Time(std::chrono::duration_cast<Clock::duration>(Millis(millis)));
}
