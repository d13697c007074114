#pragma once

#include "callguard/type_spec.hpp"
#include "callguard/value.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace callguard {

// ============================================================================
// Argument validation
//
// Checks a call's positional arguments against a compiled spec.
//
// Invariants enforced:
// 1. Every required (non-optional) parameter is present
// 2. Every present argument matches its declared descriptor
// 3. Trailing arguments beyond the spec are ignored
// 4. Tables are matched by tag only, contents are not inspected
// ============================================================================

enum class ValidationDrop : std::uint8_t {
    MissingArgument,   // required parameter absent (nil or past the end)
    TypeMismatch,      // value kind not accepted by the descriptor
    NotAnInteger,      // integer declared, number has a fractional part
    NotANumber,        // range declared, value is not a number
    OutOfRange,        // range declared, value outside [min, max]
};

struct ValidationError {
    std::size_t arg_index;
    ValidationDrop reason;
};

struct ValidationOk {};

using ValidationResult = std::variant<ValidationOk, ValidationError>;

// Validate args against spec.
//
// Contract:
// - CPU: O(spec.size() * max union width)
// - Never throws, never mutates spec
ValidationResult validate(const CompiledSpec& spec, const Args& args) noexcept;

// Check one value against one descriptor (nil stands for absence)
ValidationResult validate_one(const TypeDescriptor& type, const Value& value,
                              std::size_t arg_index = 0) noexcept;

// True if value's tag satisfies the primitive
bool matches_primitive(Primitive type, const Value& value) noexcept;

// Human-readable reason, e.g. "argument 2 (qty): out of range, expected range[1,10]"
std::string describe_failure(const CompiledSpec& spec, const ValidationError& error);

constexpr std::string_view to_string(ValidationDrop reason) noexcept {
    switch (reason) {
        case ValidationDrop::MissingArgument: return "missing argument";
        case ValidationDrop::TypeMismatch:    return "type mismatch";
        case ValidationDrop::NotAnInteger:    return "not an integer";
        case ValidationDrop::NotANumber:      return "not a number";
        case ValidationDrop::OutOfRange:      return "out of range";
    }
    return "unknown";
}

}  // namespace callguard
