#pragma once

#include "callguard/event_log.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace callguard {

// Background task that periodically evicts old event log entries.
//
// Every cycle it reads the interval from interval_source, sleeps for it,
// then evicts entries older than that same interval. Eviction goes through
// EventLog::compact(), which takes the stripe locks one at a time.
//
// Thread safety: start()/stop()/wake() may be called from any thread.
class CompactionWorker {
public:
    using IntervalSource = std::function<std::chrono::steady_clock::duration()>;

    CompactionWorker(EventLog& log, IntervalSource interval_source);
    ~CompactionWorker();

    CompactionWorker(const CompactionWorker&) = delete;
    CompactionWorker& operator=(const CompactionWorker&) = delete;

    // Start the background thread (no-op if already running)
    void start();

    // Stop and join the background thread
    void stop() noexcept;

    // Re-read the interval now instead of after the current sleep
    void wake() noexcept;

    // One compaction pass on the calling thread. Returns evicted count.
    std::size_t run_once();

    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint64_t passes() const noexcept { return passes_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint64_t total_evicted() const noexcept {
        return total_evicted_.load(std::memory_order_relaxed);
    }

private:
    void loop();

    EventLog& log_;
    IntervalSource interval_source_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool wake_requested_ = false;
    std::atomic<bool> running_{false};

    std::atomic<std::uint64_t> passes_{0};
    std::atomic<std::uint64_t> total_evicted_{0};
};

}  // namespace callguard
