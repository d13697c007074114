#include "callguard/compaction_worker.hpp"

namespace callguard {

CompactionWorker::CompactionWorker(EventLog& log, IntervalSource interval_source)
    : log_(log)
    , interval_source_(std::move(interval_source)) {}

CompactionWorker::~CompactionWorker() {
    stop();
}

void CompactionWorker::start() {
    std::lock_guard lock(mutex_);
    if (running_.load(std::memory_order_acquire)) {
        return;
    }
    stop_requested_ = false;
    wake_requested_ = false;
    running_.store(true, std::memory_order_release);
    thread_ = std::thread([this] { loop(); });
}

void CompactionWorker::stop() noexcept {
    {
        std::lock_guard lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false, std::memory_order_release);
}

void CompactionWorker::wake() noexcept {
    {
        std::lock_guard lock(mutex_);
        wake_requested_ = true;
    }
    cv_.notify_all();
}

std::size_t CompactionWorker::run_once() {
    const auto horizon = interval_source_();
    const std::size_t evicted = log_.compact(horizon);
    passes_.fetch_add(1, std::memory_order_relaxed);
    total_evicted_.fetch_add(evicted, std::memory_order_relaxed);
    return evicted;
}

void CompactionWorker::loop() {
    std::unique_lock lock(mutex_);
    while (!stop_requested_) {
        const auto interval = interval_source_();
        const bool interrupted = cv_.wait_for(lock, interval, [this] {
            return stop_requested_ || wake_requested_;
        });

        if (stop_requested_) {
            break;
        }
        if (interrupted) {
            // Interval changed: start a fresh sleep with the new value
            wake_requested_ = false;
            continue;
        }

        lock.unlock();
        run_once();
        lock.lock();
    }
}

}  // namespace callguard
