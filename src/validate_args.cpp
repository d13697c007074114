#include "callguard/validate_args.hpp"

namespace callguard {

bool matches_primitive(Primitive type, const Value& value) noexcept {
    switch (type) {
        case Primitive::String:  return value.is_string();
        case Primitive::Number:  return value.is_number();
        case Primitive::Boolean: return value.is_bool();
        case Primitive::Table:   return value.is_table();
        case Primitive::Integer: return value.is_integer();
    }
    return false;
}

namespace {

// Integer mismatch on a number is reported separately from a wrong tag
ValidationError primitive_failure(Primitive type, const Value& value, std::size_t index) noexcept {
    if (type == Primitive::Integer && value.is_number()) {
        return ValidationError{index, ValidationDrop::NotAnInteger};
    }
    return ValidationError{index, ValidationDrop::TypeMismatch};
}

}  // namespace

ValidationResult validate_one(const TypeDescriptor& type, const Value& value,
                              std::size_t arg_index) noexcept {
    // =========================================================================
    // Any: accepts everything, including absence
    // =========================================================================

    if (std::holds_alternative<AnyType>(type)) {
        return ValidationOk{};
    }

    // =========================================================================
    // Primitive / Optional
    // =========================================================================

    if (const auto* p = std::get_if<PrimitiveType>(&type)) {
        if (value.is_nil()) {
            return ValidationError{arg_index, ValidationDrop::MissingArgument};
        }
        if (!matches_primitive(p->type, value)) {
            return primitive_failure(p->type, value, arg_index);
        }
        return ValidationOk{};
    }

    if (const auto* o = std::get_if<OptionalType>(&type)) {
        if (value.is_nil() || matches_primitive(o->type, value)) {
            return ValidationOk{};
        }
        return primitive_failure(o->type, value, arg_index);
    }

    // =========================================================================
    // Union: any one alternative
    // =========================================================================

    if (const auto* u = std::get_if<UnionType>(&type)) {
        if (value.is_nil()) {
            if (u->accepts_nil) {
                return ValidationOk{};
            }
            return ValidationError{arg_index, ValidationDrop::MissingArgument};
        }
        for (Primitive alt : u->alternatives) {
            if (matches_primitive(alt, value)) {
                return ValidationOk{};
            }
        }
        return ValidationError{arg_index, ValidationDrop::TypeMismatch};
    }

    // =========================================================================
    // Range: numbers within [min, max] inclusive
    // =========================================================================

    const auto& r = std::get<RangeType>(type);
    if (value.is_nil()) {
        return ValidationError{arg_index, ValidationDrop::MissingArgument};
    }
    const double* n = value.as_number();
    if (n == nullptr) {
        return ValidationError{arg_index, ValidationDrop::NotANumber};
    }
    // NaN fails both comparisons
    if (!(*n >= r.min && *n <= r.max)) {
        return ValidationError{arg_index, ValidationDrop::OutOfRange};
    }
    return ValidationOk{};
}

ValidationResult validate(const CompiledSpec& spec, const Args& args) noexcept {
    for (std::size_t i = 0; i < spec.params.size(); ++i) {
        auto result = validate_one(spec.params[i].type, arg_at(args, i), i);
        if (std::holds_alternative<ValidationError>(result)) {
            return result;
        }
    }
    return ValidationOk{};
}

std::string describe_failure(const CompiledSpec& spec, const ValidationError& error) {
    std::string out = "argument ";
    out += std::to_string(error.arg_index + 1);
    if (error.arg_index < spec.params.size()) {
        const auto& param = spec.params[error.arg_index];
        out += " (";
        out += param.name;
        out += "): ";
        out += to_string(error.reason);
        out += ", expected ";
        out += describe(param.type);
    } else {
        out += ": ";
        out += to_string(error.reason);
    }
    return out;
}

}  // namespace callguard
