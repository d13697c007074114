#include "callguard/event_log.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace {

// Fake clock for testing
class FakeClock {
public:
    std::chrono::steady_clock::time_point now() const { return current_; }

    void advance(std::chrono::steady_clock::duration d) { current_ += d; }

    callguard::Clock as_clock() {
        return [this]() { return this->now(); };
    }

private:
    std::chrono::steady_clock::time_point current_ =
        std::chrono::steady_clock::time_point{} + std::chrono::hours(1);
};

bool test_indices_start_at_one() {
    FakeClock clock;
    callguard::NullTraceSink sink;
    callguard::EventLog log(8, clock.as_clock(), &sink);

    if (log.last_index() != callguard::kNoLogIndex) {
        std::printf("Expected no index before first record\n");
        return false;
    }

    auto a = log.record(1, "buy");
    auto b = log.record(1, "buy");
    if (a != 1 || b != 2) {
        std::printf("Expected indices 1, 2; got %llu, %llu\n",
                    static_cast<unsigned long long>(a), static_cast<unsigned long long>(b));
        return false;
    }
    if (log.size() != 2 || log.last_index() != 2) {
        return false;
    }
    return true;
}

bool test_sub_events_and_counts() {
    FakeClock clock;
    callguard::NullTraceSink sink;
    callguard::EventLog log(8, clock.as_clock(), &sink);

    auto idx = log.record(42, "trade");
    log.info(idx, "started");
    log.info(idx, "item ok");
    log.error(idx, "gold short");

    auto entry = log.find(idx);
    if (!entry) {
        std::printf("Entry missing\n");
        return false;
    }
    if (entry->caller != 42 || entry->endpoint != "trade") {
        return false;
    }
    if (entry->info_count != 2 || entry->error_count != 1 || entry->events.size() != 3) {
        std::printf("Wrong counts: info=%zu error=%zu\n", entry->info_count, entry->error_count);
        return false;
    }
    if (entry->events[2].level != callguard::EventLevel::Error ||
        entry->events[2].message != "gold short") {
        return false;
    }
    return true;
}

bool test_wraparound_eviction() {
    FakeClock clock;
    callguard::NullTraceSink sink;
    callguard::EventLog log(4, clock.as_clock(), &sink);

    // capacity + 2 records: indices 1 and 2 are gone
    for (int i = 0; i < 6; ++i) {
        log.record(1, "ping");
    }

    if (log.size() != 4) {
        std::printf("Expected 4 live entries, got %zu\n", log.size());
        return false;
    }
    if (log.contains(1) || log.contains(2)) {
        std::printf("Expected indices 1 and 2 evicted\n");
        return false;
    }
    for (callguard::LogIndex i = 3; i <= 6; ++i) {
        if (!log.contains(i)) {
            std::printf("Expected index %llu live\n", static_cast<unsigned long long>(i));
            return false;
        }
    }

    auto all = log.retrieve_all();
    if (all.size() != 4 || all.front().index != 3 || all.back().index != 6) {
        std::printf("retrieve_all not in index order\n");
        return false;
    }
    if (log.statistics().wraparound_evictions != 2) {
        return false;
    }
    return true;
}

bool test_stale_index_append_is_noop() {
    FakeClock clock;
    callguard::NullTraceSink sink;
    callguard::EventLog log(2, clock.as_clock(), &sink);

    auto old_idx = log.record(1, "a");
    log.record(1, "b");
    auto newer = log.record(1, "c");  // reuses old_idx's slot

    if (log.append(old_idx, callguard::EventLevel::Error, "late")) {
        std::printf("Append to evicted index should fail\n");
        return false;
    }
    auto entry = log.find(newer);
    if (!entry || !entry->events.empty()) {
        std::printf("Stale append leaked into the new entry\n");
        return false;
    }
    if (log.append(callguard::kNoLogIndex, callguard::EventLevel::Info, "x")) {
        return false;
    }
    return true;
}

bool test_queries() {
    FakeClock clock;
    callguard::NullTraceSink sink;
    callguard::EventLog log(16, clock.as_clock(), &sink);

    auto t0 = clock.now();
    auto a = log.record(1, "buy");
    log.info(a, "ok");
    log.info(a, "ok");

    clock.advance(std::chrono::seconds(10));
    auto b = log.record(2, "sell");
    log.error(b, "bad price");

    clock.advance(std::chrono::seconds(10));
    auto c = log.record(1, "sell");
    log.info(c, "ok");

    auto by_sender = log.retrieve_by_sender(1);
    if (by_sender.size() != 2 || by_sender[0].index != a || by_sender[1].index != c) {
        std::printf("retrieve_by_sender wrong\n");
        return false;
    }

    auto by_endpoint = log.retrieve_by_endpoint("sell");
    if (by_endpoint.size() != 2 || by_endpoint[0].index != b) {
        std::printf("retrieve_by_endpoint wrong\n");
        return false;
    }

    // Inclusive on both ends
    auto in_range = log.retrieve_by_time_range(t0, t0 + std::chrono::seconds(10));
    if (in_range.size() != 2 || in_range[1].index != b) {
        std::printf("retrieve_by_time_range wrong: %zu\n", in_range.size());
        return false;
    }

    auto busy = log.retrieve_with_min_info_count(2);
    if (busy.size() != 1 || busy[0].index != a) {
        std::printf("retrieve_with_min_info_count wrong\n");
        return false;
    }
    if (log.retrieve_with_min_info_count(0).size() != 3) {
        return false;
    }

    auto errors = log.retrieve_with_errors();
    if (errors.size() != 1 || errors[0].index != b) {
        std::printf("retrieve_with_errors wrong\n");
        return false;
    }
    return true;
}

bool test_query_returns_copies() {
    FakeClock clock;
    callguard::NullTraceSink sink;
    callguard::EventLog log(4, clock.as_clock(), &sink);

    auto idx = log.record(1, "a");
    auto snapshot = log.retrieve_all();
    log.error(idx, "after snapshot");

    if (snapshot[0].error_count != 0) {
        std::printf("Snapshot changed after append\n");
        return false;
    }
    return true;
}

bool test_statistics() {
    FakeClock clock;
    callguard::NullTraceSink sink;
    callguard::EventLog log(16, clock.as_clock(), &sink);

    auto a = log.record(1, "buy");
    log.info(a, "ok");
    auto b = log.record(2, "buy");
    log.error(b, "no");
    log.error(b, "still no");
    log.record(3, "chat");

    auto first = log.statistics();
    auto second = log.statistics();
    if (!(first == second)) {
        std::printf("statistics() not idempotent\n");
        return false;
    }

    if (first.total_entries != 3 || first.entries_with_errors != 1 ||
        first.info_events != 1 || first.error_events != 2) {
        std::printf("Wrong totals\n");
        return false;
    }
    if (first.per_endpoint.at("buy") != 2 || first.per_endpoint.at("chat") != 1) {
        std::printf("Wrong per-endpoint counts\n");
        return false;
    }
    return true;
}

bool test_compaction() {
    FakeClock clock;
    callguard::NullTraceSink sink;
    callguard::EventLog log(16, clock.as_clock(), &sink);

    auto old_a = log.record(1, "a");
    auto old_b = log.record(1, "b");
    clock.advance(std::chrono::seconds(400));
    auto fresh = log.record(1, "c");

    auto evicted = log.compact(std::chrono::seconds(300));
    if (evicted != 2) {
        std::printf("Expected 2 evicted, got %zu\n", evicted);
        return false;
    }
    if (log.contains(old_a) || log.contains(old_b) || !log.contains(fresh)) {
        return false;
    }
    if (log.size() != 1 || log.statistics().compaction_evictions != 2) {
        return false;
    }

    // Nothing left to evict
    if (log.compact(std::chrono::seconds(300)) != 0) {
        return false;
    }
    return true;
}

bool test_eviction_traces_only_when_debugging() {
    FakeClock clock;
    callguard::CapturingTraceSink sink;
    callguard::EventLog log(2, clock.as_clock(), &sink);

    log.record(7, "a");
    log.record(7, "b");
    log.record(7, "c");  // evicts #1 silently

    if (sink.count() != 0) {
        std::printf("Trace written with debugging off\n");
        return false;
    }

    log.set_debugging(true);
    auto idx = log.record(7, "d");  // evicts #2
    (void)idx;
    if (sink.count_containing("evicted log #2") != 1 ||
        sink.count_containing("wraparound") != 1) {
        std::printf("Missing wraparound trace\n");
        return false;
    }

    clock.advance(std::chrono::seconds(100));
    log.compact(std::chrono::seconds(10));
    if (sink.count_containing("retention") != 2) {
        std::printf("Expected 2 retention traces, got %zu\n", sink.count_containing("retention"));
        return false;
    }
    return true;
}

bool test_sub_event_limits() {
    FakeClock clock;
    callguard::NullTraceSink sink;
    callguard::EventLog log(2, clock.as_clock(), &sink);

    auto idx = log.record(1, "spam");
    for (std::size_t i = 0; i < callguard::LogLimits::kMaxEventsPerEntry; ++i) {
        if (!log.info(idx, "x")) {
            return false;
        }
    }
    if (log.info(idx, "one too many")) {
        std::printf("Append past the per-entry cap accepted\n");
        return false;
    }

    auto other = log.record(1, "long");
    log.error(other, std::string(callguard::LogLimits::kMaxMessageBytes * 2, 'z'));

    auto spam = log.find(idx);
    auto big = log.find(other);
    if (!spam || spam->dropped_events != 1) {
        return false;
    }
    if (!big || big->events[0].message.size() != callguard::LogLimits::kMaxMessageBytes) {
        std::printf("Message not truncated\n");
        return false;
    }
    return true;
}

bool test_clear_keeps_index_sequence() {
    FakeClock clock;
    callguard::NullTraceSink sink;
    callguard::EventLog log(4, clock.as_clock(), &sink);

    auto a = log.record(1, "a");
    log.clear();
    if (log.size() != 0 || log.contains(a)) {
        return false;
    }
    auto b = log.record(1, "b");
    if (b != a + 1) {
        std::printf("Index sequence restarted after clear\n");
        return false;
    }
    return true;
}

bool test_set_capacity() {
    FakeClock clock;
    callguard::NullTraceSink sink;
    callguard::EventLog log(8, clock.as_clock(), &sink);

    for (int i = 0; i < 8; ++i) {
        log.record(1, "x");
    }

    // Shrink: newest 3 survive
    log.set_capacity(3);
    if (log.capacity() != 3 || log.size() != 3) {
        std::printf("Shrink wrong: cap=%zu size=%zu\n", log.capacity(), log.size());
        return false;
    }
    if (!log.contains(6) || !log.contains(7) || !log.contains(8) || log.contains(5)) {
        std::printf("Wrong entries kept after shrink\n");
        return false;
    }

    // Grow: nothing lost, new records fill the extra room
    log.set_capacity(6);
    log.record(1, "y");
    log.record(1, "y");
    log.record(1, "y");
    if (log.size() != 6 || !log.contains(6) || !log.contains(11)) {
        std::printf("Grow wrong: size=%zu\n", log.size());
        return false;
    }
    return true;
}

bool test_set_capacity_traces_evictions() {
    FakeClock clock;
    callguard::CapturingTraceSink sink;
    callguard::EventLog log(8, clock.as_clock(), &sink);

    for (int i = 0; i < 8; ++i) {
        log.record(1, "x");
    }

    // Silent with debugging off
    log.set_capacity(6);
    if (sink.count() != 0) {
        std::printf("Resize traced with debugging off\n");
        return false;
    }

    // Shrinking 6 -> 2 drops #3..#6, one trace each
    log.set_debugging(true);
    log.set_capacity(2);
    if (sink.count_containing("resize") != 4 || sink.count_containing("evicted log #5") != 1 ||
        sink.count_containing("evicted log #7") != 0) {
        std::printf("Expected 4 resize traces, got %zu\n", sink.count_containing("resize"));
        return false;
    }
    return log.statistics().wraparound_evictions == 6;
}

}  // namespace

int main() {
    if (!test_indices_start_at_one()) {
        std::printf("test_indices_start_at_one failed\n");
        return EXIT_FAILURE;
    }

    if (!test_sub_events_and_counts()) {
        std::printf("test_sub_events_and_counts failed\n");
        return EXIT_FAILURE;
    }

    if (!test_wraparound_eviction()) {
        std::printf("test_wraparound_eviction failed\n");
        return EXIT_FAILURE;
    }

    if (!test_stale_index_append_is_noop()) {
        std::printf("test_stale_index_append_is_noop failed\n");
        return EXIT_FAILURE;
    }

    if (!test_queries()) {
        std::printf("test_queries failed\n");
        return EXIT_FAILURE;
    }

    if (!test_query_returns_copies()) {
        std::printf("test_query_returns_copies failed\n");
        return EXIT_FAILURE;
    }

    if (!test_statistics()) {
        std::printf("test_statistics failed\n");
        return EXIT_FAILURE;
    }

    if (!test_compaction()) {
        std::printf("test_compaction failed\n");
        return EXIT_FAILURE;
    }

    if (!test_eviction_traces_only_when_debugging()) {
        std::printf("test_eviction_traces_only_when_debugging failed\n");
        return EXIT_FAILURE;
    }

    if (!test_sub_event_limits()) {
        std::printf("test_sub_event_limits failed\n");
        return EXIT_FAILURE;
    }

    if (!test_clear_keeps_index_sequence()) {
        std::printf("test_clear_keeps_index_sequence failed\n");
        return EXIT_FAILURE;
    }

    if (!test_set_capacity()) {
        std::printf("test_set_capacity failed\n");
        return EXIT_FAILURE;
    }

    if (!test_set_capacity_traces_evictions()) {
        std::printf("test_set_capacity_traces_evictions failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All event_log tests passed\n");
    return EXIT_SUCCESS;
}
