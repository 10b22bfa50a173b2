#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace tradesync {
namespace utils {

// Epoch milliseconds source; components take one so tests can drive time.
using ClockFn = std::function<long long()>;

inline long long getCurrentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

inline ClockFn systemClock() {
    return []() { return getCurrentTimeMs(); };
}

// 2026-10-19T08:15:00.123Z
std::string formatIsoUtc(long long epoch_ms);

} // namespace utils
} // namespace tradesync
