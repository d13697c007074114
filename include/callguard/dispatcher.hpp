#pragma once

#include "callguard/compaction_worker.hpp"
#include "callguard/config.hpp"
#include "callguard/event_log.hpp"
#include "callguard/middleware.hpp"
#include "callguard/rate_limiter.hpp"
#include "callguard/trace.hpp"
#include "callguard/type_spec.hpp"
#include "callguard/types.hpp"
#include "callguard/validate_args.hpp"
#include "callguard/value.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace callguard {

// ============================================================================
// Dispatcher
//
// Front door for every remote call. Per call:
//
//   Received -> MiddlewareCheck -> RateLimitCheck -> ParamValidation
//            -> CallbackInvocation -> Completed
//
// The first failing stage is terminal: the call is rejected, an error
// sub-event naming the stage is logged, and the application callback is
// not invoked. A callback that throws is caught and logged; it never
// escapes the dispatcher.
//
// Thread safety: fire()/invoke() may run concurrently from any number of
// threads. Registration may happen while calls are in flight.
// ============================================================================

// Pipeline stage that rejected a call
enum class Stage : std::uint8_t {
    Lookup,       // no endpoint registered under that name
    Middleware,   // a gate rejected (or threw)
    RateLimit,    // window ceiling reached
    Validation,   // arguments did not match the spec
    Callback,     // application callback threw
};

// Successful call. value is the callback's return verbatim (always empty
// for Event endpoints); an empty value means "no data" to the caller.
struct Reply {
    std::optional<Value> value;
    LogIndex log_index = kNoLogIndex;
};

// Failure sentinel returned to request/response callers
struct CallFailure {
    Stage stage;
    std::string reason;
    LogIndex log_index = kNoLogIndex;
};

using CallResult = std::variant<Reply, CallFailure>;

// Application callbacks. Arguments have passed validation.
using EventCallback = std::function<void(CallerId, LogIndex, const Args&)>;
using FunctionCallback = std::function<std::optional<Value>(CallerId, LogIndex, const Args&)>;

struct EndpointOptions {
    bool force_logging = false;  // record every call, ignoring log sampling
};

enum class RegisterError : std::uint8_t {
    EmptyName,          // endpoint name is empty
    MissingCallback,    // callback is an empty function
    InvalidSpec,        // parameter spec failed to compile
    DuplicateEndpoint,  // name already registered
    UnknownEndpoint,    // use()/unregister() on a name never registered
};

struct RegisterFailure {
    RegisterError error;
    std::optional<SpecError> spec_error;  // set when error == InvalidSpec
};

// nullopt on success
using RegisterResult = std::optional<RegisterFailure>;

// Counters per terminal state (cumulative)
struct DispatcherMetrics {
    std::uint64_t received = 0;
    std::uint64_t completed = 0;
    std::uint64_t lookup_rejections = 0;
    std::uint64_t middleware_rejections = 0;
    std::uint64_t rate_limit_rejections = 0;
    std::uint64_t validation_rejections = 0;
    std::uint64_t callback_errors = 0;
};

class Dispatcher {
public:
    // config must be valid (see validate_config). An invalid config is
    // replaced by kDefaultConfig and reported through trace.
    explicit Dispatcher(FirewallConfig config = {},
                        Clock clock = default_clock,
                        TraceSink* trace = &default_trace_sink());
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // ------------------------------------------------------------------
    // Registration
    // ------------------------------------------------------------------

    // Fire-and-forget endpoint. flat_spec: {"name1", "type1", ...}
    RegisterResult register_event(std::string_view name,
                                  std::span<const std::string_view> flat_spec,
                                  EventCallback callback,
                                  EndpointOptions options = {});
    RegisterResult register_event(std::string_view name,
                                  std::initializer_list<std::string_view> flat_spec,
                                  EventCallback callback,
                                  EndpointOptions options = {});

    // Request/response endpoint
    RegisterResult register_function(std::string_view name,
                                     std::span<const std::string_view> flat_spec,
                                     FunctionCallback callback,
                                     EndpointOptions options = {});
    RegisterResult register_function(std::string_view name,
                                     std::initializer_list<std::string_view> flat_spec,
                                     FunctionCallback callback,
                                     EndpointOptions options = {});

    // Append a middleware gate to a registered endpoint
    RegisterResult use(std::string_view name, Gate gate);

    // Remove an endpoint and its middleware. Calls already past lookup finish.
    RegisterResult unregister(std::string_view name);

    [[nodiscard]] std::optional<EndpointInfo> endpoint_info(std::string_view name) const;
    [[nodiscard]] std::size_t endpoint_count() const;

    // ------------------------------------------------------------------
    // Delivery (called by the host transport)
    // ------------------------------------------------------------------

    // Fire-and-forget delivery. The result is for the host's bookkeeping;
    // nothing is sent back to the remote caller.
    CallResult fire(CallerId caller, std::string_view name, const Args& args);

    // Request/response delivery
    [[nodiscard]] CallResult invoke(CallerId caller, std::string_view name, const Args& args);

    // ------------------------------------------------------------------
    // Configuration and lifecycle
    // ------------------------------------------------------------------

    // Validate and apply a new configuration while calls are in flight
    std::optional<ConfigError> configure(const FirewallConfig& config);
    [[nodiscard]] FirewallConfig config() const { return config_.snapshot(); }

    // Background compaction every cleanup_interval
    void start();
    void stop() noexcept;

    // ------------------------------------------------------------------
    // Observability
    // ------------------------------------------------------------------

    [[nodiscard]] EventLog& log() noexcept { return log_; }
    [[nodiscard]] const EventLog& log() const noexcept { return log_; }
    [[nodiscard]] const RateLimiter& limiter() const noexcept { return limiter_; }
    [[nodiscard]] const MiddlewareChain& middleware() const noexcept { return middleware_; }
    [[nodiscard]] CompactionWorker& compaction() noexcept { return compaction_; }

    [[nodiscard]] DispatcherMetrics metrics() const noexcept;

private:
    struct Endpoint {
        EndpointInfo info;
        CompiledSpec spec;
        EventCallback on_event;
        FunctionCallback on_function;
        std::atomic<std::uint64_t> received{0};  // drives log sampling
    };

    RegisterResult add_endpoint(std::string_view name,
                                std::span<const std::string_view> flat_spec,
                                EndpointKind kind,
                                EventCallback on_event,
                                FunctionCallback on_function,
                                EndpointOptions options);

    [[nodiscard]] std::shared_ptr<Endpoint> lookup(std::string_view name) const;

    CallResult dispatch(CallerId caller, std::string_view name, const Args& args);

    CallFailure reject(Stage stage, std::string reason, CallerId caller,
                       std::string_view name, LogIndex log_index,
                       std::string_view detail, bool debugging);

    void apply(const FirewallConfig& config);

    std::mutex configure_mutex_;  // serializes configure()
    ConfigStore config_;
    EventLog log_;
    RateLimiter limiter_;
    MiddlewareChain middleware_;
    CompactionWorker compaction_;
    TraceSink* trace_;

    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Endpoint>> endpoints_;

    // Metrics
    std::atomic<std::uint64_t> received_{0};
    std::atomic<std::uint64_t> completed_{0};
    std::atomic<std::uint64_t> lookup_rejections_{0};
    std::atomic<std::uint64_t> middleware_rejections_{0};
    std::atomic<std::uint64_t> rate_limit_rejections_{0};
    std::atomic<std::uint64_t> validation_rejections_{0};
    std::atomic<std::uint64_t> callback_errors_{0};
};

// Build a dispatcher from an untrusted config
std::variant<std::unique_ptr<Dispatcher>, ConfigError> make_dispatcher(
    const FirewallConfig& config,
    Clock clock = default_clock,
    TraceSink* trace = &default_trace_sink());

// True if result is a Reply
inline bool succeeded(const CallResult& result) noexcept {
    return std::holds_alternative<Reply>(result);
}

constexpr std::string_view to_string(Stage stage) noexcept {
    switch (stage) {
        case Stage::Lookup:     return "lookup";
        case Stage::Middleware: return "middleware";
        case Stage::RateLimit:  return "rate limit";
        case Stage::Validation: return "validation";
        case Stage::Callback:   return "callback";
    }
    return "unknown";
}

constexpr std::string_view to_string(RegisterError error) noexcept {
    switch (error) {
        case RegisterError::EmptyName:         return "empty endpoint name";
        case RegisterError::MissingCallback:   return "missing callback";
        case RegisterError::InvalidSpec:       return "invalid parameter spec";
        case RegisterError::DuplicateEndpoint: return "endpoint already registered";
        case RegisterError::UnknownEndpoint:   return "unknown endpoint";
    }
    return "unknown";
}

}  // namespace callguard
