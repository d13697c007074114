#pragma once

#include "callguard/event_log.hpp"
#include "callguard/type_spec.hpp"
#include "callguard/types.hpp"
#include "callguard/value.hpp"

#include <cstddef>
#include <initializer_list>
#include <span>
#include <string_view>

namespace callguard {

// ============================================================================
// Assertion helpers
//
// Checks for application callbacks. Each returns true when the predicate
// holds and appends nothing. On failure it appends one error sub-event to
// the entry at index and returns false.
//
// The predicate is evaluated even when index is kNoLogIndex or already
// evicted; only the append becomes a no-op.
//
// Thread safety: stateless, safe from any thread.
// ============================================================================

// value is a number in [min, max]
bool assert_in_range(EventLog& log, LogIndex index, const Value& value,
                     double min, double max);

// value equals one of allowed
bool assert_in_list(EventLog& log, LogIndex index, const Value& value,
                    std::span<const Value> allowed);
bool assert_in_list(EventLog& log, LogIndex index, const Value& value,
                    std::initializer_list<Value> allowed);

// Longest string assert_string_pattern will run the regex engine on.
// std::regex recurses per input character, so longer strings fail unmatched.
inline constexpr std::size_t kMaxPatternInputBytes = 1024;

// value is a string fully matching pattern (ECMAScript). A pattern that
// does not compile, or a string over kMaxPatternInputBytes, counts as a
// failure.
bool assert_string_pattern(EventLog& log, LogIndex index, const Value& value,
                           std::string_view pattern);

// value's tag satisfies type
bool assert_type(EventLog& log, LogIndex index, const Value& value, Primitive type);

// value is a string with byte length in [min, max]
bool assert_string_length(EventLog& log, LogIndex index, const Value& value,
                          std::size_t min, std::size_t max);

bool assert_not_nil(EventLog& log, LogIndex index, const Value& value);

// Logs message when condition is false
bool assert_true(EventLog& log, LogIndex index, bool condition, std::string_view message);

}  // namespace callguard
