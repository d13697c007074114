#include "callguard/assertions.hpp"

#include "callguard/validate_args.hpp"

#include <cmath>
#include <cstdio>
#include <regex>
#include <string>

namespace callguard {

namespace {

constexpr std::size_t kMaxRenderedStringBytes = 32;

std::string render_number(double n) {
    char buf[32];
    if (std::isfinite(n) && std::trunc(n) == n && std::fabs(n) < 1e15) {
        std::snprintf(buf, sizeof(buf), "%.0f", n);
    } else {
        std::snprintf(buf, sizeof(buf), "%g", n);
    }
    return buf;
}

// Short form of a value for failure messages
std::string render(const Value& value) {
    if (const auto* n = value.as_number()) {
        return render_number(*n);
    }
    if (const auto* s = value.as_string()) {
        std::string out = "\"";
        out += s->substr(0, kMaxRenderedStringBytes);
        if (s->size() > kMaxRenderedStringBytes) {
            out += "...";
        }
        out += "\"";
        return out;
    }
    if (const auto* b = value.as_bool()) {
        return *b ? "true" : "false";
    }
    return std::string(to_string(value.kind()));
}

bool fail(EventLog& log, LogIndex index, const std::string& message) {
    log.error(index, "assertion failed: " + message);
    return false;
}

}  // namespace

bool assert_in_range(EventLog& log, LogIndex index, const Value& value,
                     double min, double max) {
    const auto* n = value.as_number();
    if (n != nullptr && *n >= min && *n <= max) {
        return true;
    }
    return fail(log, index, render(value) + " not in range [" + render_number(min) + ", " +
                                render_number(max) + "]");
}

bool assert_in_list(EventLog& log, LogIndex index, const Value& value,
                    std::span<const Value> allowed) {
    for (const auto& candidate : allowed) {
        if (candidate == value) {
            return true;
        }
    }

    std::string message = render(value) + " not in list [";
    for (std::size_t i = 0; i < allowed.size(); ++i) {
        if (i > 0) {
            message += ", ";
        }
        message += render(allowed[i]);
    }
    message += "]";
    return fail(log, index, message);
}

bool assert_in_list(EventLog& log, LogIndex index, const Value& value,
                    std::initializer_list<Value> allowed) {
    return assert_in_list(log, index, value,
                          std::span<const Value>(allowed.begin(), allowed.size()));
}

bool assert_string_pattern(EventLog& log, LogIndex index, const Value& value,
                           std::string_view pattern) {
    std::regex re;
    try {
        re.assign(pattern.begin(), pattern.end(), std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        return fail(log, index, "invalid pattern /" + std::string(pattern) + "/: " + e.what());
    }

    const auto* s = value.as_string();
    if (s != nullptr && s->size() > kMaxPatternInputBytes) {
        return fail(log, index, render(value) + " (" + std::to_string(s->size()) +
                                    " bytes) too long to match /" + std::string(pattern) + "/");
    }

    bool matched = false;
    if (s != nullptr) {
        try {
            matched = std::regex_match(*s, re);
        } catch (const std::regex_error& e) {
            return fail(log, index, render(value) + " could not be matched against /" +
                                        std::string(pattern) + "/: " + e.what());
        }
    }
    if (matched) {
        return true;
    }
    return fail(log, index, render(value) + " does not match /" + std::string(pattern) + "/");
}

bool assert_type(EventLog& log, LogIndex index, const Value& value, Primitive type) {
    if (matches_primitive(type, value)) {
        return true;
    }
    std::string message = "expected ";
    message += to_string(type);
    message += ", got ";
    message += render(value);
    return fail(log, index, message);
}

bool assert_string_length(EventLog& log, LogIndex index, const Value& value,
                          std::size_t min, std::size_t max) {
    const auto* s = value.as_string();
    if (s != nullptr && s->size() >= min && s->size() <= max) {
        return true;
    }
    std::string message = s != nullptr ? "string length " + std::to_string(s->size())
                                       : render(value) + " is not a string, length";
    message += " not in [" + std::to_string(min) + ", " + std::to_string(max) + "]";
    return fail(log, index, message);
}

bool assert_not_nil(EventLog& log, LogIndex index, const Value& value) {
    if (!value.is_nil()) {
        return true;
    }
    return fail(log, index, "value is nil");
}

bool assert_true(EventLog& log, LogIndex index, bool condition, std::string_view message) {
    if (condition) {
        return true;
    }
    return fail(log, index, std::string(message));
}

}  // namespace callguard
