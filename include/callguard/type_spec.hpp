#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace callguard {

// ============================================================================
// Declarative parameter specs
//
// An endpoint declares its parameters as (name, type) pairs, with types in a
// small string grammar:
//
//   type      = "any" | range | union [ "?" | "nullable" ]
//   range     = "range[" number "," number "]"
//   union     = primitive ( "|" primitive )*
//   primitive = "string" | "number" | "boolean" | "table" | "integer" | "nil"
//
// Whitespace between tokens is ignored, so "string nullable" and
// "stringnullable" are the same optional string.
//
// Specs are compiled once at registration into TypeDescriptor values.
// Validation only ever reads the compiled form.
// ============================================================================

enum class Primitive : std::uint8_t {
    String,
    Number,
    Boolean,
    Table,
    Integer,
};

// Primitive, never absent
struct PrimitiveType {
    Primitive type;
};

// Primitive or absent
struct OptionalType {
    Primitive type;
};

// Any one of the alternatives (order not significant)
struct UnionType {
    std::vector<Primitive> alternatives;
    bool accepts_nil = false;
};

// Number with min <= v <= max
struct RangeType {
    double min;
    double max;
};

// Anything, including absence
struct AnyType {};

using TypeDescriptor =
    std::variant<PrimitiveType, OptionalType, UnionType, RangeType, AnyType>;

struct CompiledParam {
    std::string name;
    TypeDescriptor type;
};

// Immutable result of compile()
struct CompiledSpec {
    std::vector<CompiledParam> params;

    [[nodiscard]] std::size_t size() const noexcept { return params.size(); }
    [[nodiscard]] bool empty() const noexcept { return params.empty(); }
};

// One declared parameter
struct ParamDecl {
    std::string_view name;
    std::string_view type;
};

// Reasons a declarative spec is rejected at registration
enum class SpecErrorKind : std::uint8_t {
    MismatchedPairing,   // flat list has a name without a type
    EmptyName,           // parameter name is empty
    DuplicateName,       // same name declared twice
    EmptyType,           // type string is empty
    UnknownType,         // unrecognized type token
    MalformedRange,      // range[...] syntax or bounds unparsable
    InvertedRange,       // range min > max
    MalformedUnion,      // empty alternative or non-primitive in a union
};

struct SpecError {
    SpecErrorKind kind;
    std::size_t param_index;  // position of the offending parameter
};

using SpecResult = std::variant<CompiledSpec, SpecError>;

// Compile (name, type) pairs.
//
// Contract:
// - Never throws on malformed input; returns the first SpecError
// - Parameter order is preserved
SpecResult compile(std::span<const ParamDecl> decls);
SpecResult compile(std::initializer_list<ParamDecl> decls);

// Compile a flat alternating list: {"name1", "type1", "name2", "type2", ...}
SpecResult compile_flat(std::span<const std::string_view> flat);
SpecResult compile_flat(std::initializer_list<std::string_view> flat);

// Parse a single type string
std::variant<TypeDescriptor, SpecErrorKind> parse_type(std::string_view text);

// Canonical text for a descriptor, e.g. "string?", "number|string", "range[1,5]"
std::string describe(const TypeDescriptor& type);

constexpr std::string_view to_string(Primitive p) noexcept {
    switch (p) {
        case Primitive::String:  return "string";
        case Primitive::Number:  return "number";
        case Primitive::Boolean: return "boolean";
        case Primitive::Table:   return "table";
        case Primitive::Integer: return "integer";
    }
    return "unknown";
}

constexpr std::string_view to_string(SpecErrorKind kind) noexcept {
    switch (kind) {
        case SpecErrorKind::MismatchedPairing: return "mismatched name/type pairing";
        case SpecErrorKind::EmptyName:         return "empty parameter name";
        case SpecErrorKind::DuplicateName:     return "duplicate parameter name";
        case SpecErrorKind::EmptyType:         return "empty type";
        case SpecErrorKind::UnknownType:       return "unknown type";
        case SpecErrorKind::MalformedRange:    return "malformed range";
        case SpecErrorKind::InvertedRange:     return "range min exceeds max";
        case SpecErrorKind::MalformedUnion:    return "malformed union";
    }
    return "unknown";
}

}  // namespace callguard
