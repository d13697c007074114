#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <variant>

namespace callguard {

// Firewall configuration
// Consumed at startup and on every reconfiguration
struct FirewallConfig {
    std::size_t max_log_count = 1000;          // event log capacity (entries)
    std::uint32_t cleanup_interval_sec = 300;  // compaction period and retention horizon
    std::uint32_t rate_limit_window_sec = 60;  // fixed window length
    std::uint32_t rate_limit_max_requests = 30;  // accepted calls per window per (caller, endpoint)
    bool debugging_mode = false;               // trace evictions and rejections
    std::uint32_t log_sample_every = 1;        // record 1 in N received calls per endpoint

    [[nodiscard]] std::chrono::seconds cleanup_interval() const noexcept {
        return std::chrono::seconds(cleanup_interval_sec);
    }
    [[nodiscard]] std::chrono::seconds rate_limit_window() const noexcept {
        return std::chrono::seconds(rate_limit_window_sec);
    }
};

inline constexpr FirewallConfig kDefaultConfig = {};

// Reasons a configuration is refused
enum class ConfigError : std::uint8_t {
    MaxLogCountZero,
    CleanupIntervalZero,
    RateLimitWindowZero,
    RateLimitMaxRequestsZero,
    LogSampleEveryZero,
    // Text loading
    MissingEquals,       // line is not key=value
    UnknownKey,          // key is not a recognized option
    InvalidValue,        // value does not parse for the key's type
    FileUnreadable,      // config file could not be opened
};

// Check option ranges. Returns the first problem found.
// CPU: O(1)
std::optional<ConfigError> validate_config(const FirewallConfig& config) noexcept;

// ============================================================================
// Text configuration
//
// One option per line: key=value. Blank lines and lines starting with '#'
// are ignored. Keys:
//   max_log_count, cleanup_interval, rate_limit_window,
//   rate_limit_max_requests, debugging_mode, log_sample_every
// Booleans accept true/false/1/0.
// ============================================================================

struct ConfigLoadError {
    ConfigError error;
    std::size_t line;  // 1-based, 0 when not line-specific
};

using ConfigLoadResult = std::variant<FirewallConfig, ConfigLoadError>;

// Apply one key=value line to config. Returns the error, if any.
std::optional<ConfigError> parse_config_line(std::string_view line, FirewallConfig& config) noexcept;

// Parse a whole document on top of base, then validate the result
ConfigLoadResult load_config(std::string_view text, const FirewallConfig& base = kDefaultConfig);

// Read and parse a file
ConfigLoadResult load_config_file(const std::string& path,
                                  const FirewallConfig& base = kDefaultConfig);

// ============================================================================
// ConfigStore
//
// Process-wide configuration with an explicit, synchronized update path.
// Readers take a snapshot; writers replace the whole struct.
//
// Thread safety: safe for concurrent readers and writers.
// ============================================================================

class ConfigStore {
public:
    // config is assumed valid (validated by the caller)
    explicit ConfigStore(FirewallConfig config = {});

    [[nodiscard]] FirewallConfig snapshot() const;

    // Validate and replace. Leaves the current config untouched on error.
    std::optional<ConfigError> update(const FirewallConfig& config);

    // Incremented on every successful update
    [[nodiscard]] std::uint64_t version() const;

private:
    mutable std::shared_mutex mutex_;
    FirewallConfig config_;
    std::uint64_t version_ = 0;
};

constexpr std::string_view to_string(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::MaxLogCountZero:          return "max_log_count must be positive";
        case ConfigError::CleanupIntervalZero:      return "cleanup_interval must be positive";
        case ConfigError::RateLimitWindowZero:      return "rate_limit_window must be positive";
        case ConfigError::RateLimitMaxRequestsZero: return "rate_limit_max_requests must be positive";
        case ConfigError::LogSampleEveryZero:       return "log_sample_every must be positive";
        case ConfigError::MissingEquals:            return "expected key=value";
        case ConfigError::UnknownKey:               return "unknown key";
        case ConfigError::InvalidValue:             return "invalid value";
        case ConfigError::FileUnreadable:           return "config file unreadable";
    }
    return "unknown";
}

}  // namespace callguard
