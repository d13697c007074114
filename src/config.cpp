#include "callguard/config.hpp"

#include <charconv>
#include <fstream>
#include <limits>
#include <mutex>
#include <sstream>

namespace callguard {

std::optional<ConfigError> validate_config(const FirewallConfig& config) noexcept {
    if (config.max_log_count == 0) {
        return ConfigError::MaxLogCountZero;
    }
    if (config.cleanup_interval_sec == 0) {
        return ConfigError::CleanupIntervalZero;
    }
    if (config.rate_limit_window_sec == 0) {
        return ConfigError::RateLimitWindowZero;
    }
    if (config.rate_limit_max_requests == 0) {
        return ConfigError::RateLimitMaxRequestsZero;
    }
    if (config.log_sample_every == 0) {
        return ConfigError::LogSampleEveryZero;
    }
    return std::nullopt;
}

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' ||
                          s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

template <typename T>
bool parse_unsigned(std::string_view s, T& out) noexcept {
    std::uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) {
        return false;
    }
    if (v > std::numeric_limits<T>::max()) {
        return false;
    }
    out = static_cast<T>(v);
    return true;
}

bool parse_bool(std::string_view s, bool& out) noexcept {
    if (s == "true" || s == "1") {
        out = true;
        return true;
    }
    if (s == "false" || s == "0") {
        out = false;
        return true;
    }
    return false;
}

}  // namespace

std::optional<ConfigError> parse_config_line(std::string_view line, FirewallConfig& config) noexcept {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    auto eq = line.find('=');
    if (eq == std::string_view::npos) {
        return ConfigError::MissingEquals;
    }

    auto key = trim(line.substr(0, eq));
    auto value = trim(line.substr(eq + 1));

    bool ok = false;
    if (key == "max_log_count") {
        ok = parse_unsigned(value, config.max_log_count);
    } else if (key == "cleanup_interval") {
        ok = parse_unsigned(value, config.cleanup_interval_sec);
    } else if (key == "rate_limit_window") {
        ok = parse_unsigned(value, config.rate_limit_window_sec);
    } else if (key == "rate_limit_max_requests") {
        ok = parse_unsigned(value, config.rate_limit_max_requests);
    } else if (key == "log_sample_every") {
        ok = parse_unsigned(value, config.log_sample_every);
    } else if (key == "debugging_mode") {
        ok = parse_bool(value, config.debugging_mode);
    } else {
        return ConfigError::UnknownKey;
    }

    if (!ok) {
        return ConfigError::InvalidValue;
    }
    return std::nullopt;
}

ConfigLoadResult load_config(std::string_view text, const FirewallConfig& base) {
    FirewallConfig config = base;
    std::size_t line_no = 0;

    while (!text.empty()) {
        ++line_no;
        auto nl = text.find('\n');
        auto line = text.substr(0, nl);
        text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);

        if (auto err = parse_config_line(line, config)) {
            return ConfigLoadError{*err, line_no};
        }
    }

    if (auto err = validate_config(config)) {
        return ConfigLoadError{*err, 0};
    }
    return config;
}

ConfigLoadResult load_config_file(const std::string& path, const FirewallConfig& base) {
    std::ifstream in(path);
    if (!in) {
        return ConfigLoadError{ConfigError::FileUnreadable, 0};
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return load_config(contents.str(), base);
}

// ============================================================================
// ConfigStore Implementation
// ============================================================================

ConfigStore::ConfigStore(FirewallConfig config)
    : config_(config) {}

FirewallConfig ConfigStore::snapshot() const {
    std::shared_lock lock(mutex_);
    return config_;
}

std::optional<ConfigError> ConfigStore::update(const FirewallConfig& config) {
    if (auto err = validate_config(config)) {
        return err;
    }
    std::unique_lock lock(mutex_);
    config_ = config;
    ++version_;
    return std::nullopt;
}

std::uint64_t ConfigStore::version() const {
    std::shared_lock lock(mutex_);
    return version_;
}

}  // namespace callguard
