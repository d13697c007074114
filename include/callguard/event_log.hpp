#pragma once

#include "callguard/trace.hpp"
#include "callguard/types.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace callguard {

// ============================================================================
// Event Log
//
// Fixed-capacity circular store of call records. Each received call gets one
// entry; the pipeline and application code attach sub-events to it through
// its LogIndex.
//
// Invariants enforced:
// - At most capacity() live entries; index i lives in slot i % capacity()
// - Recording index i evicts index i - capacity() (wraparound)
// - Stale indices resolve to nothing: append() on them is a no-op
// - Queries return copies in index order, never live references
//
// Thread safety: safe for concurrent use. Slots are guarded by striped
// mutexes; only set_capacity() takes the layout lock exclusively.
// ============================================================================

// Bounds on a single entry
struct LogLimits {
    static constexpr std::size_t kMaxEventsPerEntry = 64;
    static constexpr std::size_t kMaxMessageBytes = 512;
};

enum class EventLevel : std::uint8_t {
    Info,
    Error,
};

struct SubEvent {
    EventLevel level;
    std::string message;  // truncated to kMaxMessageBytes
};

struct LogEntry {
    LogIndex index = kNoLogIndex;
    CallerId caller = 0;
    std::string endpoint;
    TimePoint timestamp{};
    std::vector<SubEvent> events;
    std::size_t info_count = 0;
    std::size_t error_count = 0;
    std::size_t dropped_events = 0;  // appends refused at kMaxEventsPerEntry

    [[nodiscard]] bool has_errors() const noexcept { return error_count > 0; }
};

// Aggregate view over live entries
struct LogStatistics {
    std::size_t total_entries = 0;
    std::size_t entries_with_errors = 0;
    std::size_t info_events = 0;
    std::size_t error_events = 0;
    std::map<std::string, std::size_t, std::less<>> per_endpoint;

    // Cumulative since construction
    std::uint64_t wraparound_evictions = 0;
    std::uint64_t compaction_evictions = 0;

    bool operator==(const LogStatistics&) const = default;
};

class EventLog {
public:
    static constexpr std::size_t kStripeCount = 16;

    // capacity must be positive. trace may be null (no eviction traces).
    explicit EventLog(std::size_t capacity,
                      Clock clock = default_clock,
                      TraceSink* trace = &default_trace_sink());

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    // Allocate the next entry, evicting the oldest if full.
    // Returns its index (never kNoLogIndex).
    LogIndex record(CallerId caller, std::string_view endpoint);

    // Add a sub-event. Returns false if the entry no longer exists or is
    // full. Eviction is routine: callers are not expected to check.
    bool append(LogIndex index, EventLevel level, std::string_view message);

    bool info(LogIndex index, std::string_view message) {
        return append(index, EventLevel::Info, message);
    }
    bool error(LogIndex index, std::string_view message) {
        return append(index, EventLevel::Error, message);
    }

    // Copy of one entry, if still live
    [[nodiscard]] std::optional<LogEntry> find(LogIndex index) const;

    // Whether index still resolves
    [[nodiscard]] bool contains(LogIndex index) const;

    // Queries: snapshot copies in index (insertion) order
    [[nodiscard]] std::vector<LogEntry> retrieve_all() const;
    [[nodiscard]] std::vector<LogEntry> retrieve_by_sender(CallerId caller) const;
    [[nodiscard]] std::vector<LogEntry> retrieve_by_endpoint(std::string_view endpoint) const;
    // Inclusive on both ends
    [[nodiscard]] std::vector<LogEntry> retrieve_by_time_range(TimePoint start, TimePoint end) const;
    [[nodiscard]] std::vector<LogEntry> retrieve_with_min_info_count(std::size_t n) const;
    [[nodiscard]] std::vector<LogEntry> retrieve_with_errors() const;

    [[nodiscard]] LogStatistics statistics() const;

    // Evict entries with timestamp < now - horizon. Returns evicted count.
    std::size_t compact(TimePoint now, std::chrono::steady_clock::duration horizon);

    // Same, using the injected clock for now
    std::size_t compact(std::chrono::steady_clock::duration horizon) {
        return compact(clock_(), horizon);
    }

    // Drop every entry. Index allocation continues, so old handles stay dead.
    void clear();

    // Resize the buffer, keeping the most recent entries that fit.
    // Blocks live traffic for the duration.
    void set_capacity(std::size_t capacity);

    [[nodiscard]] std::size_t capacity() const;
    [[nodiscard]] std::size_t size() const noexcept { return live_.load(std::memory_order_relaxed); }

    // Most recently allocated index (kNoLogIndex before the first record)
    [[nodiscard]] LogIndex last_index() const noexcept {
        return next_index_.load(std::memory_order_relaxed) - 1;
    }

    // Enable eviction traces
    void set_debugging(bool enabled) noexcept { debugging_.store(enabled, std::memory_order_relaxed); }
    [[nodiscard]] bool debugging() const noexcept { return debugging_.load(std::memory_order_relaxed); }

private:
    struct Slot {
        std::optional<LogEntry> entry;
    };

    std::mutex& stripe_for(std::size_t slot) const noexcept {
        return stripes_[slot % kStripeCount];
    }

    // Copy entries matching pred, sorted by index.
    // Caller must NOT hold any stripe lock.
    template <typename Pred>
    std::vector<LogEntry> collect(Pred pred) const;

    std::string describe_eviction(const LogEntry& entry, std::string_view cause) const;
    void emit_trace(const std::string& line) noexcept;

    mutable std::shared_mutex layout_mutex_;
    mutable std::array<std::mutex, kStripeCount> stripes_;
    std::vector<Slot> slots_;

    std::atomic<LogIndex> next_index_{1};
    std::atomic<std::size_t> live_{0};
    std::atomic<std::uint64_t> wraparound_evictions_{0};
    std::atomic<std::uint64_t> compaction_evictions_{0};
    std::atomic<bool> debugging_{false};

    Clock clock_;
    TraceSink* trace_;
};

constexpr std::string_view to_string(EventLevel level) noexcept {
    switch (level) {
        case EventLevel::Info:  return "info";
        case EventLevel::Error: return "error";
    }
    return "unknown";
}

}  // namespace callguard
