#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace callguard {

// Caller identity as supplied by the host transport (e.g. a player id)
using CallerId = std::uint64_t;

// Weak handle to an event log entry. Resolved on every use.
using LogIndex = std::uint64_t;

// Handle that never resolves (call was not logged)
inline constexpr LogIndex kNoLogIndex = 0;

using TimePoint = std::chrono::steady_clock::time_point;

// Clock abstraction for testing
// Default uses steady_clock, tests can inject fake clock
using Clock = std::function<TimePoint()>;

inline TimePoint default_clock() {
    return std::chrono::steady_clock::now();
}

}  // namespace callguard
