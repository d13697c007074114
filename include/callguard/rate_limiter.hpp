#pragma once

#include "callguard/types.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace callguard {

// Identifies one rate-limited stream: a caller on one endpoint
struct CallKey {
    CallerId caller;
    std::string endpoint;

    bool operator==(const CallKey& other) const noexcept {
        return caller == other.caller && endpoint == other.endpoint;
    }
};

}  // namespace callguard

// Hash specialization for CallKey
template <>
struct std::hash<callguard::CallKey> {
    std::size_t operator()(const callguard::CallKey& k) const noexcept {
        std::size_t h = std::hash<std::string>{}(k.endpoint);
        // boost::hash_combine mixing
        h ^= std::hash<std::uint64_t>{}(k.caller) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

namespace callguard {

// Result of admission check
enum class Admit : std::uint8_t {
    Allow,   // Within the window's budget
    Drop     // Ceiling reached for the current window
};

struct RateLimiterConfig {
    std::chrono::steady_clock::duration window = std::chrono::seconds(60);
    std::uint32_t max_requests = 30;
};

// Per-(caller, endpoint) fixed-window rate limiter.
//
// Invariants enforced:
// - At most max_requests admits per key per window
// - A denied call does not restart or extend the window
// - Stale windows are reset lazily on the next call, never swept
//
// Thread safety: safe for concurrent use. Keys are spread over kShardCount
// shards, each with its own mutex.
class RateLimiter {
public:
    static constexpr std::size_t kShardCount = 16;

    explicit RateLimiter(RateLimiterConfig config = {},
                         Clock clock = default_clock);

    // Check if a call should be admitted. Counts it if allowed.
    Admit allow(CallerId caller, std::string_view endpoint);

    // Give back one admission in the current window (call was rejected
    // after admission). No-op if the window has since expired.
    void refund(CallerId caller, std::string_view endpoint);

    // Admits left for this key in its current window
    [[nodiscard]] std::uint32_t remaining(CallerId caller, std::string_view endpoint) const;

    // Apply new limits. Existing windows keep their start time and count.
    void set_limits(RateLimiterConfig config) noexcept;
    [[nodiscard]] RateLimiterConfig limits() const noexcept;

    // Forget one key / every key
    void reset(CallerId caller, std::string_view endpoint);
    void reset_all();

    // Current number of tracked keys
    [[nodiscard]] std::size_t tracked_count() const;

    // Check if a key is currently tracked (for testing)
    [[nodiscard]] bool is_tracked(CallerId caller, std::string_view endpoint) const;

    // Metrics
    [[nodiscard]] std::uint64_t total_admits() const noexcept {
        return total_admits_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] std::uint64_t total_drops() const noexcept {
        return total_drops_.load(std::memory_order_relaxed);
    }

private:
    // Window state for a single key
    struct Window {
        TimePoint start;
        std::uint32_t count;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<CallKey, Window> windows;
    };

    [[nodiscard]] Shard& shard_for(const CallKey& key) noexcept;
    [[nodiscard]] const Shard& shard_for(const CallKey& key) const noexcept;

    [[nodiscard]] bool expired(const Window& w, TimePoint now) const noexcept;

    std::array<Shard, kShardCount> shards_;
    std::atomic<std::chrono::steady_clock::rep> window_ticks_;
    std::atomic<std::uint32_t> max_requests_;
    Clock clock_;

    // Metrics
    std::atomic<std::uint64_t> total_admits_{0};
    std::atomic<std::uint64_t> total_drops_{0};
};

}  // namespace callguard
