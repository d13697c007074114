#include "callguard/event_log.hpp"

#include <algorithm>

namespace callguard {

EventLog::EventLog(std::size_t capacity, Clock clock, TraceSink* trace)
    : slots_(capacity == 0 ? 1 : capacity)
    , clock_(std::move(clock))
    , trace_(trace) {}

LogIndex EventLog::record(CallerId caller, std::string_view endpoint) {
    LogEntry fresh;
    fresh.caller = caller;
    fresh.endpoint = std::string(endpoint);
    fresh.timestamp = clock_();

    std::string trace_line;
    LogIndex index = kNoLogIndex;
    {
        std::shared_lock layout(layout_mutex_);
        index = next_index_.fetch_add(1, std::memory_order_relaxed);
        fresh.index = index;

        const std::size_t slot = index % slots_.size();
        std::lock_guard lock(stripe_for(slot));
        auto& current = slots_[slot].entry;

        if (!current) {
            current = std::move(fresh);
            live_.fetch_add(1, std::memory_order_relaxed);
        } else if (current->index < index) {
            // Wraparound: oldest entry for this slot is overwritten
            if (debugging()) {
                trace_line = describe_eviction(*current, "wraparound");
            }
            current = std::move(fresh);
            wraparound_evictions_.fetch_add(1, std::memory_order_relaxed);
        } else {
            // A newer index already claimed the slot while this call was
            // allocating; this entry is evicted before it is ever visible
            wraparound_evictions_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    if (!trace_line.empty()) {
        emit_trace(trace_line);
    }
    return index;
}

bool EventLog::append(LogIndex index, EventLevel level, std::string_view message) {
    if (index == kNoLogIndex) {
        return false;
    }

    std::shared_lock layout(layout_mutex_);
    const std::size_t slot = index % slots_.size();
    std::lock_guard lock(stripe_for(slot));
    auto& current = slots_[slot].entry;

    if (!current || current->index != index) {
        return false;  // evicted or never allocated
    }

    if (current->events.size() >= LogLimits::kMaxEventsPerEntry) {
        ++current->dropped_events;
        return false;
    }

    current->events.push_back(SubEvent{
        .level = level,
        .message = std::string(message.substr(0, LogLimits::kMaxMessageBytes)),
    });
    if (level == EventLevel::Error) {
        ++current->error_count;
    } else {
        ++current->info_count;
    }
    return true;
}

std::optional<LogEntry> EventLog::find(LogIndex index) const {
    if (index == kNoLogIndex) {
        return std::nullopt;
    }

    std::shared_lock layout(layout_mutex_);
    const std::size_t slot = index % slots_.size();
    std::lock_guard lock(stripe_for(slot));
    const auto& current = slots_[slot].entry;
    if (!current || current->index != index) {
        return std::nullopt;
    }
    return *current;
}

bool EventLog::contains(LogIndex index) const {
    if (index == kNoLogIndex) {
        return false;
    }

    std::shared_lock layout(layout_mutex_);
    const std::size_t slot = index % slots_.size();
    std::lock_guard lock(stripe_for(slot));
    const auto& current = slots_[slot].entry;
    return current && current->index == index;
}

template <typename Pred>
std::vector<LogEntry> EventLog::collect(Pred pred) const {
    std::vector<LogEntry> out;
    {
        std::shared_lock layout(layout_mutex_);
        for (std::size_t stripe = 0; stripe < kStripeCount; ++stripe) {
            std::lock_guard lock(stripes_[stripe]);
            for (std::size_t slot = stripe; slot < slots_.size(); slot += kStripeCount) {
                const auto& current = slots_[slot].entry;
                if (current && pred(*current)) {
                    out.push_back(*current);
                }
            }
        }
    }

    std::sort(out.begin(), out.end(), [](const LogEntry& a, const LogEntry& b) {
        return a.index < b.index;
    });
    return out;
}

std::vector<LogEntry> EventLog::retrieve_all() const {
    return collect([](const LogEntry&) { return true; });
}

std::vector<LogEntry> EventLog::retrieve_by_sender(CallerId caller) const {
    return collect([caller](const LogEntry& e) { return e.caller == caller; });
}

std::vector<LogEntry> EventLog::retrieve_by_endpoint(std::string_view endpoint) const {
    return collect([endpoint](const LogEntry& e) { return e.endpoint == endpoint; });
}

std::vector<LogEntry> EventLog::retrieve_by_time_range(TimePoint start, TimePoint end) const {
    return collect([start, end](const LogEntry& e) {
        return e.timestamp >= start && e.timestamp <= end;
    });
}

std::vector<LogEntry> EventLog::retrieve_with_min_info_count(std::size_t n) const {
    return collect([n](const LogEntry& e) { return e.info_count >= n; });
}

std::vector<LogEntry> EventLog::retrieve_with_errors() const {
    return collect([](const LogEntry& e) { return e.has_errors(); });
}

LogStatistics EventLog::statistics() const {
    LogStatistics stats;
    {
        std::shared_lock layout(layout_mutex_);
        for (std::size_t stripe = 0; stripe < kStripeCount; ++stripe) {
            std::lock_guard lock(stripes_[stripe]);
            for (std::size_t slot = stripe; slot < slots_.size(); slot += kStripeCount) {
                const auto& current = slots_[slot].entry;
                if (!current) {
                    continue;
                }
                ++stats.total_entries;
                if (current->has_errors()) {
                    ++stats.entries_with_errors;
                }
                stats.info_events += current->info_count;
                stats.error_events += current->error_count;

                auto it = stats.per_endpoint.find(current->endpoint);
                if (it == stats.per_endpoint.end()) {
                    stats.per_endpoint.emplace(current->endpoint, 1);
                } else {
                    ++it->second;
                }
            }
        }
    }

    stats.wraparound_evictions = wraparound_evictions_.load(std::memory_order_relaxed);
    stats.compaction_evictions = compaction_evictions_.load(std::memory_order_relaxed);
    return stats;
}

std::size_t EventLog::compact(TimePoint now, std::chrono::steady_clock::duration horizon) {
    const TimePoint cutoff = now - horizon;
    const bool tracing = debugging();
    std::size_t evicted = 0;

    std::shared_lock layout(layout_mutex_);
    for (std::size_t stripe = 0; stripe < kStripeCount; ++stripe) {
        std::vector<std::string> traces;
        {
            std::lock_guard lock(stripes_[stripe]);
            for (std::size_t slot = stripe; slot < slots_.size(); slot += kStripeCount) {
                auto& current = slots_[slot].entry;
                if (!current || current->timestamp >= cutoff) {
                    continue;
                }
                if (tracing) {
                    traces.push_back(describe_eviction(*current, "retention"));
                }
                current.reset();
                ++evicted;
            }
        }
        // Emit outside the stripe lock so live traffic is not held up by the sink
        for (const auto& line : traces) {
            emit_trace(line);
        }
    }

    live_.fetch_sub(evicted, std::memory_order_relaxed);
    compaction_evictions_.fetch_add(evicted, std::memory_order_relaxed);
    return evicted;
}

void EventLog::clear() {
    std::shared_lock layout(layout_mutex_);
    for (std::size_t stripe = 0; stripe < kStripeCount; ++stripe) {
        std::lock_guard lock(stripes_[stripe]);
        for (std::size_t slot = stripe; slot < slots_.size(); slot += kStripeCount) {
            if (slots_[slot].entry) {
                slots_[slot].entry.reset();
                live_.fetch_sub(1, std::memory_order_relaxed);
            }
        }
    }
}

void EventLog::set_capacity(std::size_t capacity) {
    if (capacity == 0) {
        capacity = 1;
    }

    const bool tracing = debugging();
    std::vector<std::string> traces;

    std::unique_lock layout(layout_mutex_);
    if (capacity == slots_.size()) {
        return;
    }

    // Keep only the last `capacity` allocated indices: they map to distinct
    // slots in the new layout.
    const LogIndex next = next_index_.load(std::memory_order_relaxed);
    const LogIndex oldest_kept = next > capacity ? next - capacity : 1;

    std::vector<Slot> resized(capacity);
    std::size_t kept = 0;
    std::uint64_t dropped = 0;
    for (auto& slot : slots_) {
        if (!slot.entry) {
            continue;
        }
        if (slot.entry->index >= oldest_kept) {
            const LogIndex index = slot.entry->index;
            resized[index % capacity].entry = std::move(slot.entry);
            ++kept;
        } else {
            if (tracing) {
                traces.push_back(describe_eviction(*slot.entry, "resize"));
            }
            ++dropped;
        }
    }

    slots_ = std::move(resized);
    live_.store(kept, std::memory_order_relaxed);
    wraparound_evictions_.fetch_add(dropped, std::memory_order_relaxed);
    layout.unlock();

    for (const auto& line : traces) {
        emit_trace(line);
    }
}

std::size_t EventLog::capacity() const {
    std::shared_lock layout(layout_mutex_);
    return slots_.size();
}

std::string EventLog::describe_eviction(const LogEntry& entry, std::string_view cause) const {
    std::string line = "evicted log #";
    line += std::to_string(entry.index);
    line += " (caller ";
    line += std::to_string(entry.caller);
    line += ", endpoint ";
    line += entry.endpoint;
    line += ", ";
    line += std::to_string(entry.error_count);
    line += " errors): ";
    line += cause;
    return line;
}

void EventLog::emit_trace(const std::string& line) noexcept {
    if (trace_ != nullptr) {
        trace_->write(line);
    }
}

}  // namespace callguard
