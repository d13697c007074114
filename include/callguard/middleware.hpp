#pragma once

#include "callguard/event_log.hpp"
#include "callguard/types.hpp"
#include "callguard/value.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace callguard {

// Call shape of an endpoint
enum class EndpointKind : std::uint8_t {
    Event,     // fire-and-forget, no response
    Function,  // request/response
};

// Registration-time facts about an endpoint, visible to gates
struct EndpointInfo {
    std::string name;
    EndpointKind kind = EndpointKind::Event;
    bool force_logging = false;
};

// Everything a gate may inspect about a call
struct GateContext {
    CallerId caller;
    LogIndex log_index;
    const EndpointInfo& endpoint;
    const Args& args;
};

// Returns true to accept the call, false to reject it
using Gate = std::function<bool(const GateContext&)>;

enum class GateOutcome : std::uint8_t {
    Accepted,   // every gate accepted (or the chain is empty)
    Rejected,   // a gate returned false
    Threw,      // a gate threw; treated as a rejection
};

struct ChainResult {
    GateOutcome outcome = GateOutcome::Accepted;
    std::size_t gate_position = 0;  // 0-based position of the rejecting gate
    std::string error;              // exception text when outcome == Threw

    [[nodiscard]] bool accepted() const noexcept { return outcome == GateOutcome::Accepted; }
};

// ============================================================================
// MiddlewareChain
//
// Per-endpoint ordered lists of gates, run before rate limiting and
// validation.
//
// Invariants enforced:
// - Gates run strictly in insertion order
// - The first rejection stops the chain
// - A throwing gate is a rejection plus an error sub-event; the exception
//   never leaves run()
//
// Thread safety: safe for concurrent use. Endpoints are spread over
// kShardCount shards. Each endpoint's list is copy-on-write, so run()
// holds no lock while gates execute.
// ============================================================================

class MiddlewareChain {
public:
    static constexpr std::size_t kShardCount = 16;

    // log may be null (gate exceptions are then only reported in ChainResult)
    explicit MiddlewareChain(EventLog* log = nullptr);

    // Append a gate to endpoint's chain. Empty functions are ignored.
    void add(std::string_view endpoint, Gate gate);

    // Run endpoint's chain for one call
    ChainResult run(const EndpointInfo& endpoint, CallerId caller,
                    LogIndex log_index, const Args& args) const;

    // Number of gates registered for endpoint
    [[nodiscard]] std::size_t size(std::string_view endpoint) const;

    // Drop endpoint's chain entirely
    void remove_endpoint(std::string_view endpoint);

private:
    using GateList = std::vector<Gate>;

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<const GateList>> chains;
    };

    [[nodiscard]] Shard& shard_for(std::string_view endpoint) noexcept;
    [[nodiscard]] const Shard& shard_for(std::string_view endpoint) const noexcept;

    [[nodiscard]] std::shared_ptr<const GateList> chain_for(std::string_view endpoint) const;

    std::array<Shard, kShardCount> shards_;
    EventLog* log_;
};

constexpr std::string_view to_string(EndpointKind kind) noexcept {
    switch (kind) {
        case EndpointKind::Event:    return "event";
        case EndpointKind::Function: return "function";
    }
    return "unknown";
}

}  // namespace callguard
