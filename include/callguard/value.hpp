#pragma once

#include <cmath>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace callguard {

// ============================================================================
// Call argument model
//
// Remote calls carry an ordered list of dynamically typed values. Each value
// is exactly one of: nil (absent), boolean, number, string or table.
// Tables are shared and immutable once built, so copying a Value never
// deep-copies a table.
// ============================================================================

class Value;

// Marker for an absent argument
struct Nil {
    bool operator==(const Nil&) const noexcept { return true; }
};

// Associative structured value (string keys)
using Table = std::map<std::string, Value, std::less<>>;
using TablePtr = std::shared_ptr<const Table>;

// Runtime tag of a value (what the validator matches against)
enum class ValueKind : std::uint8_t {
    Nil,
    Boolean,
    Number,
    String,
    Table,
};

class Value {
public:
    Value() noexcept = default;
    Value(Nil) noexcept {}
    Value(bool b) noexcept : data_(b) {}

    // Every integer and floating type becomes a number; bool stays a boolean
    template <typename T,
              std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T n) noexcept : data_(static_cast<double>(n)) {}

    Value(std::string s) : data_(std::move(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(Table t) : data_(std::make_shared<const Table>(std::move(t))) {}
    Value(TablePtr t) : data_(std::move(t)) {}

    [[nodiscard]] ValueKind kind() const noexcept {
        return static_cast<ValueKind>(data_.index());
    }

    [[nodiscard]] bool is_nil() const noexcept { return kind() == ValueKind::Nil; }
    [[nodiscard]] bool is_bool() const noexcept { return kind() == ValueKind::Boolean; }
    [[nodiscard]] bool is_number() const noexcept { return kind() == ValueKind::Number; }
    [[nodiscard]] bool is_string() const noexcept { return kind() == ValueKind::String; }
    [[nodiscard]] bool is_table() const noexcept { return kind() == ValueKind::Table; }

    // Finite number with no fractional part
    [[nodiscard]] bool is_integer() const noexcept {
        if (!is_number()) {
            return false;
        }
        double n = std::get<double>(data_);
        return std::isfinite(n) && std::trunc(n) == n;
    }

    // Typed accessors. Return nullptr when the value holds another kind.
    [[nodiscard]] const bool* as_bool() const noexcept { return std::get_if<bool>(&data_); }
    [[nodiscard]] const double* as_number() const noexcept { return std::get_if<double>(&data_); }
    [[nodiscard]] const std::string* as_string() const noexcept {
        return std::get_if<std::string>(&data_);
    }
    [[nodiscard]] const Table* as_table() const noexcept {
        const auto* t = std::get_if<TablePtr>(&data_);
        return (t != nullptr && *t) ? t->get() : nullptr;
    }

    // Tables compare by identity, everything else by value
    bool operator==(const Value& other) const noexcept { return data_ == other.data_; }

private:
    // Alternative order must match ValueKind
    std::variant<Nil, bool, double, std::string, TablePtr> data_;
};

// Ordered positional call arguments
using Args = std::vector<Value>;

// Argument at position i, or nil past the end
inline const Value& arg_at(const Args& args, std::size_t i) noexcept {
    static const Value kNilValue{};
    return i < args.size() ? args[i] : kNilValue;
}

constexpr std::string_view to_string(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::Nil:     return "nil";
        case ValueKind::Boolean: return "boolean";
        case ValueKind::Number:  return "number";
        case ValueKind::String:  return "string";
        case ValueKind::Table:   return "table";
    }
    return "unknown";
}

}  // namespace callguard
