#include "callguard/rate_limiter.hpp"

namespace callguard {

RateLimiter::RateLimiter(RateLimiterConfig config, Clock clock)
    : window_ticks_(config.window.count())
    , max_requests_(config.max_requests)
    , clock_(std::move(clock)) {}

RateLimiter::Shard& RateLimiter::shard_for(const CallKey& key) noexcept {
    return shards_[std::hash<CallKey>{}(key) % kShardCount];
}

const RateLimiter::Shard& RateLimiter::shard_for(const CallKey& key) const noexcept {
    return shards_[std::hash<CallKey>{}(key) % kShardCount];
}

bool RateLimiter::expired(const Window& w, TimePoint now) const noexcept {
    const auto window = std::chrono::steady_clock::duration(
        window_ticks_.load(std::memory_order_relaxed));
    // A clock that went backwards keeps the current window
    return now - w.start >= window;
}

Admit RateLimiter::allow(CallerId caller, std::string_view endpoint) {
    const auto now = clock_();
    const std::uint32_t ceiling = max_requests_.load(std::memory_order_relaxed);
    CallKey key{caller, std::string(endpoint)};

    auto& shard = shard_for(key);
    std::lock_guard lock(shard.mutex);

    auto it = shard.windows.find(key);
    if (it == shard.windows.end()) {
        // New key: open a window with this call
        shard.windows.emplace(std::move(key), Window{.start = now, .count = 1});
        total_admits_.fetch_add(1, std::memory_order_relaxed);
        return Admit::Allow;
    }

    Window& w = it->second;
    if (expired(w, now)) {
        w.start = now;
        w.count = 1;
        total_admits_.fetch_add(1, std::memory_order_relaxed);
        return Admit::Allow;
    }

    if (w.count < ceiling) {
        ++w.count;
        total_admits_.fetch_add(1, std::memory_order_relaxed);
        return Admit::Allow;
    }

    // At the ceiling: the count stays put and the window is not restarted
    total_drops_.fetch_add(1, std::memory_order_relaxed);
    return Admit::Drop;
}

void RateLimiter::refund(CallerId caller, std::string_view endpoint) {
    const auto now = clock_();
    CallKey key{caller, std::string(endpoint)};

    auto& shard = shard_for(key);
    std::lock_guard lock(shard.mutex);

    auto it = shard.windows.find(key);
    if (it == shard.windows.end() || expired(it->second, now) || it->second.count == 0) {
        return;
    }
    --it->second.count;
}

std::uint32_t RateLimiter::remaining(CallerId caller, std::string_view endpoint) const {
    const auto now = clock_();
    const std::uint32_t ceiling = max_requests_.load(std::memory_order_relaxed);
    CallKey key{caller, std::string(endpoint)};

    const auto& shard = shard_for(key);
    std::lock_guard lock(shard.mutex);

    auto it = shard.windows.find(key);
    if (it == shard.windows.end() || expired(it->second, now)) {
        return ceiling;
    }
    return it->second.count >= ceiling ? 0 : ceiling - it->second.count;
}

void RateLimiter::set_limits(RateLimiterConfig config) noexcept {
    window_ticks_.store(config.window.count(), std::memory_order_relaxed);
    max_requests_.store(config.max_requests, std::memory_order_relaxed);
}

RateLimiterConfig RateLimiter::limits() const noexcept {
    return RateLimiterConfig{
        .window = std::chrono::steady_clock::duration(
            window_ticks_.load(std::memory_order_relaxed)),
        .max_requests = max_requests_.load(std::memory_order_relaxed),
    };
}

void RateLimiter::reset(CallerId caller, std::string_view endpoint) {
    CallKey key{caller, std::string(endpoint)};
    auto& shard = shard_for(key);
    std::lock_guard lock(shard.mutex);
    shard.windows.erase(key);
}

void RateLimiter::reset_all() {
    for (auto& shard : shards_) {
        std::lock_guard lock(shard.mutex);
        shard.windows.clear();
    }
}

std::size_t RateLimiter::tracked_count() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard lock(shard.mutex);
        total += shard.windows.size();
    }
    return total;
}

bool RateLimiter::is_tracked(CallerId caller, std::string_view endpoint) const {
    CallKey key{caller, std::string(endpoint)};
    const auto& shard = shard_for(key);
    std::lock_guard lock(shard.mutex);
    return shard.windows.find(key) != shard.windows.end();
}

}  // namespace callguard
