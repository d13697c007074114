#include "callguard/dispatcher.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <mutex>

namespace callguard {

namespace {

constexpr std::size_t kMaxTracedNameBytes = 64;

FirewallConfig sanitize(const FirewallConfig& config, TraceSink* trace) {
    if (auto err = validate_config(config)) {
        if (trace != nullptr) {
            std::string line = "invalid configuration (";
            line += to_string(*err);
            line += "), using defaults";
            trace->write(line);
        }
        return kDefaultConfig;
    }
    return config;
}

RateLimiterConfig limiter_config(const FirewallConfig& config) {
    return RateLimiterConfig{
        .window = config.rate_limit_window(),
        .max_requests = config.rate_limit_max_requests,
    };
}

// Arguments as the callback sees them: exactly one per declared parameter
Args shape_arguments(const CompiledSpec& spec, const Args& args) {
    if (spec.empty()) {
        return args;
    }
    Args shaped(args.begin(), args.begin() + static_cast<std::ptrdiff_t>(
                                                 std::min(args.size(), spec.size())));
    shaped.resize(spec.size());
    return shaped;
}

std::string_view clip(std::string_view name) noexcept {
    return name.substr(0, kMaxTracedNameBytes);
}

}  // namespace

Dispatcher::Dispatcher(FirewallConfig config, Clock clock, TraceSink* trace)
    : config_(sanitize(config, trace))
    , log_(config_.snapshot().max_log_count, clock, trace)
    , limiter_(limiter_config(config_.snapshot()), clock)
    , middleware_(&log_)
    , compaction_(log_, [this] {
          return std::chrono::steady_clock::duration(config_.snapshot().cleanup_interval());
      })
    , trace_(trace) {
    log_.set_debugging(config_.snapshot().debugging_mode);
}

Dispatcher::~Dispatcher() {
    stop();
}

// ============================================================================
// Registration
// ============================================================================

RegisterResult Dispatcher::add_endpoint(std::string_view name,
                                        std::span<const std::string_view> flat_spec,
                                        EndpointKind kind,
                                        EventCallback on_event,
                                        FunctionCallback on_function,
                                        EndpointOptions options) {
    if (name.empty()) {
        return RegisterFailure{RegisterError::EmptyName, std::nullopt};
    }
    if ((kind == EndpointKind::Event && !on_event) ||
        (kind == EndpointKind::Function && !on_function)) {
        return RegisterFailure{RegisterError::MissingCallback, std::nullopt};
    }

    // Compile before touching the registry: a bad spec registers nothing
    auto compiled = compile_flat(flat_spec);
    if (const auto* err = std::get_if<SpecError>(&compiled)) {
        if (trace_ != nullptr) {
            std::string line = "refused endpoint ";
            line += clip(name);
            line += ": parameter ";
            line += std::to_string(err->param_index + 1);
            line += ": ";
            line += to_string(err->kind);
            trace_->write(line);
        }
        return RegisterFailure{RegisterError::InvalidSpec, *err};
    }

    auto endpoint = std::make_shared<Endpoint>();
    endpoint->info = EndpointInfo{
        .name = std::string(name),
        .kind = kind,
        .force_logging = options.force_logging,
    };
    endpoint->spec = std::get<CompiledSpec>(std::move(compiled));
    endpoint->on_event = std::move(on_event);
    endpoint->on_function = std::move(on_function);

    std::unique_lock lock(registry_mutex_);
    auto [it, inserted] = endpoints_.try_emplace(std::string(name), std::move(endpoint));
    if (!inserted) {
        return RegisterFailure{RegisterError::DuplicateEndpoint, std::nullopt};
    }
    return std::nullopt;
}

RegisterResult Dispatcher::register_event(std::string_view name,
                                          std::span<const std::string_view> flat_spec,
                                          EventCallback callback,
                                          EndpointOptions options) {
    return add_endpoint(name, flat_spec, EndpointKind::Event,
                        std::move(callback), nullptr, options);
}

RegisterResult Dispatcher::register_event(std::string_view name,
                                          std::initializer_list<std::string_view> flat_spec,
                                          EventCallback callback,
                                          EndpointOptions options) {
    return register_event(name,
                          std::span<const std::string_view>(flat_spec.begin(), flat_spec.size()),
                          std::move(callback), options);
}

RegisterResult Dispatcher::register_function(std::string_view name,
                                             std::span<const std::string_view> flat_spec,
                                             FunctionCallback callback,
                                             EndpointOptions options) {
    return add_endpoint(name, flat_spec, EndpointKind::Function,
                        nullptr, std::move(callback), options);
}

RegisterResult Dispatcher::register_function(std::string_view name,
                                             std::initializer_list<std::string_view> flat_spec,
                                             FunctionCallback callback,
                                             EndpointOptions options) {
    return register_function(name,
                             std::span<const std::string_view>(flat_spec.begin(), flat_spec.size()),
                             std::move(callback), options);
}

RegisterResult Dispatcher::use(std::string_view name, Gate gate) {
    if (!lookup(name)) {
        return RegisterFailure{RegisterError::UnknownEndpoint, std::nullopt};
    }
    middleware_.add(name, std::move(gate));
    return std::nullopt;
}

RegisterResult Dispatcher::unregister(std::string_view name) {
    {
        std::unique_lock lock(registry_mutex_);
        auto it = endpoints_.find(std::string(name));
        if (it == endpoints_.end()) {
            return RegisterFailure{RegisterError::UnknownEndpoint, std::nullopt};
        }
        endpoints_.erase(it);
    }
    middleware_.remove_endpoint(name);
    return std::nullopt;
}

std::optional<EndpointInfo> Dispatcher::endpoint_info(std::string_view name) const {
    auto endpoint = lookup(name);
    if (!endpoint) {
        return std::nullopt;
    }
    return endpoint->info;
}

std::size_t Dispatcher::endpoint_count() const {
    std::shared_lock lock(registry_mutex_);
    return endpoints_.size();
}

std::shared_ptr<Dispatcher::Endpoint> Dispatcher::lookup(std::string_view name) const {
    std::shared_lock lock(registry_mutex_);
    auto it = endpoints_.find(std::string(name));
    if (it == endpoints_.end()) {
        return nullptr;
    }
    return it->second;
}

// ============================================================================
// Delivery
// ============================================================================

CallResult Dispatcher::fire(CallerId caller, std::string_view name, const Args& args) {
    return dispatch(caller, name, args);
}

CallResult Dispatcher::invoke(CallerId caller, std::string_view name, const Args& args) {
    return dispatch(caller, name, args);
}

CallResult Dispatcher::dispatch(CallerId caller, std::string_view name, const Args& args) {
    received_.fetch_add(1, std::memory_order_relaxed);
    const FirewallConfig cfg = config_.snapshot();

    // =========================================================================
    // Received
    // =========================================================================

    auto endpoint = lookup(name);
    if (!endpoint) {
        return reject(Stage::Lookup, "no such endpoint", caller, clip(name),
                      kNoLogIndex, {}, cfg.debugging_mode);
    }

    const auto seen = endpoint->received.fetch_add(1, std::memory_order_relaxed);
    const bool sampled = endpoint->info.force_logging || seen % cfg.log_sample_every == 0;
    const LogIndex log_index = sampled ? log_.record(caller, name) : kNoLogIndex;

    // =========================================================================
    // MiddlewareCheck
    // =========================================================================

    auto chain = middleware_.run(endpoint->info, caller, log_index, args);
    if (!chain.accepted()) {
        std::string reason = chain.outcome == GateOutcome::Threw
                                 ? "gate " + std::to_string(chain.gate_position + 1) + " threw"
                                 : "rejected by gate " + std::to_string(chain.gate_position + 1);
        return reject(Stage::Middleware, std::move(reason), caller, name, log_index,
                      chain.error, cfg.debugging_mode);
    }

    // =========================================================================
    // RateLimitCheck
    // =========================================================================

    if (limiter_.allow(caller, name) == Admit::Drop) {
        std::string reason = "exceeded " + std::to_string(cfg.rate_limit_max_requests) +
                             " calls per " + std::to_string(cfg.rate_limit_window_sec) + "s";
        return reject(Stage::RateLimit, std::move(reason), caller, name, log_index,
                      {}, cfg.debugging_mode);
    }

    // =========================================================================
    // ParamValidation
    // =========================================================================

    auto validation = validate(endpoint->spec, args);
    if (const auto* err = std::get_if<ValidationError>(&validation)) {
        // Malformed calls do not use up the caller's window
        limiter_.refund(caller, name);
        return reject(Stage::Validation, describe_failure(endpoint->spec, *err), caller,
                      name, log_index, {}, cfg.debugging_mode);
    }

    // =========================================================================
    // CallbackInvocation
    // =========================================================================

    const Args shaped = shape_arguments(endpoint->spec, args);
    Reply reply;
    std::string callback_error;
    try {
        if (endpoint->info.kind == EndpointKind::Function) {
            reply.value = endpoint->on_function(caller, log_index, shaped);
        } else {
            endpoint->on_event(caller, log_index, shaped);
        }
    } catch (const std::exception& e) {
        callback_error = e.what();
        if (callback_error.empty()) {
            callback_error = "exception without message";
        }
    } catch (...) {
        callback_error = "non-standard exception";
    }

    if (!callback_error.empty()) {
        return reject(Stage::Callback, "callback threw: " + callback_error, caller, name,
                      log_index, {}, cfg.debugging_mode);
    }

    // =========================================================================
    // Completed
    // =========================================================================

    log_.info(log_index, "completed");
    completed_.fetch_add(1, std::memory_order_relaxed);
    reply.log_index = log_index;
    return reply;
}

CallFailure Dispatcher::reject(Stage stage, std::string reason, CallerId caller,
                               std::string_view name, LogIndex log_index,
                               std::string_view detail, bool debugging) {
    // Failures are always logged, sampled or not
    if (log_index == kNoLogIndex) {
        log_index = log_.record(caller, name);
        if (!detail.empty()) {
            log_.error(log_index, detail);
        }
    }

    std::string message = "rejected at ";
    message += to_string(stage);
    message += ": ";
    message += reason;
    log_.error(log_index, message);

    switch (stage) {
        case Stage::Lookup:     lookup_rejections_.fetch_add(1, std::memory_order_relaxed); break;
        case Stage::Middleware: middleware_rejections_.fetch_add(1, std::memory_order_relaxed); break;
        case Stage::RateLimit:  rate_limit_rejections_.fetch_add(1, std::memory_order_relaxed); break;
        case Stage::Validation: validation_rejections_.fetch_add(1, std::memory_order_relaxed); break;
        case Stage::Callback:   callback_errors_.fetch_add(1, std::memory_order_relaxed); break;
    }

    if (debugging && trace_ != nullptr) {
        std::string line = "caller ";
        line += std::to_string(caller);
        line += " -> ";
        line += clip(name);
        line += " (log #";
        line += std::to_string(log_index);
        line += ") ";
        line += message;
        trace_->write(line);
    }

    return CallFailure{
        .stage = stage,
        .reason = std::move(reason),
        .log_index = log_index,
    };
}

// ============================================================================
// Configuration and lifecycle
// ============================================================================

std::optional<ConfigError> Dispatcher::configure(const FirewallConfig& config) {
    // Store and components change together; concurrent configure() calls
    // must not interleave their update and apply steps
    std::lock_guard<std::mutex> lock(configure_mutex_);
    if (auto err = config_.update(config)) {
        return err;
    }
    apply(config);
    return std::nullopt;
}

void Dispatcher::apply(const FirewallConfig& config) {
    log_.set_capacity(config.max_log_count);
    log_.set_debugging(config.debugging_mode);
    limiter_.set_limits(limiter_config(config));
    compaction_.wake();
}

void Dispatcher::start() {
    compaction_.start();
}

void Dispatcher::stop() noexcept {
    compaction_.stop();
}

DispatcherMetrics Dispatcher::metrics() const noexcept {
    return DispatcherMetrics{
        .received = received_.load(std::memory_order_relaxed),
        .completed = completed_.load(std::memory_order_relaxed),
        .lookup_rejections = lookup_rejections_.load(std::memory_order_relaxed),
        .middleware_rejections = middleware_rejections_.load(std::memory_order_relaxed),
        .rate_limit_rejections = rate_limit_rejections_.load(std::memory_order_relaxed),
        .validation_rejections = validation_rejections_.load(std::memory_order_relaxed),
        .callback_errors = callback_errors_.load(std::memory_order_relaxed),
    };
}

std::variant<std::unique_ptr<Dispatcher>, ConfigError> make_dispatcher(
    const FirewallConfig& config, Clock clock, TraceSink* trace) {
    if (auto err = validate_config(config)) {
        return *err;
    }
    return std::make_unique<Dispatcher>(config, std::move(clock), trace);
}

}  // namespace callguard
