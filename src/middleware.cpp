#include "callguard/middleware.hpp"

#include <exception>
#include <mutex>

namespace callguard {

MiddlewareChain::MiddlewareChain(EventLog* log)
    : log_(log) {}

MiddlewareChain::Shard& MiddlewareChain::shard_for(std::string_view endpoint) noexcept {
    return shards_[std::hash<std::string_view>{}(endpoint) % kShardCount];
}

const MiddlewareChain::Shard& MiddlewareChain::shard_for(std::string_view endpoint) const noexcept {
    return shards_[std::hash<std::string_view>{}(endpoint) % kShardCount];
}

void MiddlewareChain::add(std::string_view endpoint, Gate gate) {
    if (!gate) {
        return;
    }

    auto& shard = shard_for(endpoint);
    std::unique_lock lock(shard.mutex);

    auto& current = shard.chains[std::string(endpoint)];
    // Copy-on-write: in-flight run() calls keep the list they started with
    auto next = current ? std::make_shared<GateList>(*current) : std::make_shared<GateList>();
    next->push_back(std::move(gate));
    current = std::move(next);
}

std::shared_ptr<const MiddlewareChain::GateList>
MiddlewareChain::chain_for(std::string_view endpoint) const {
    const auto& shard = shard_for(endpoint);
    std::shared_lock lock(shard.mutex);
    auto it = shard.chains.find(std::string(endpoint));
    if (it == shard.chains.end()) {
        return nullptr;
    }
    return it->second;
}

ChainResult MiddlewareChain::run(const EndpointInfo& endpoint, CallerId caller,
                                 LogIndex log_index, const Args& args) const {
    ChainResult result;
    auto gates = chain_for(endpoint.name);
    if (!gates) {
        return result;
    }

    const GateContext ctx{
        .caller = caller,
        .log_index = log_index,
        .endpoint = endpoint,
        .args = args,
    };

    for (std::size_t i = 0; i < gates->size(); ++i) {
        bool accepted = false;
        try {
            accepted = (*gates)[i](ctx);
        } catch (const std::exception& e) {
            result.outcome = GateOutcome::Threw;
            result.error = e.what();
        } catch (...) {
            result.outcome = GateOutcome::Threw;
            result.error = "non-standard exception";
        }

        if (result.outcome == GateOutcome::Threw) {
            result.gate_position = i;
            if (log_ != nullptr) {
                log_->error(log_index, "middleware gate " + std::to_string(i + 1) +
                                           " threw: " + result.error);
            }
            return result;
        }

        if (!accepted) {
            result.outcome = GateOutcome::Rejected;
            result.gate_position = i;
            return result;
        }
    }

    return result;
}

std::size_t MiddlewareChain::size(std::string_view endpoint) const {
    auto gates = chain_for(endpoint);
    return gates ? gates->size() : 0;
}

void MiddlewareChain::remove_endpoint(std::string_view endpoint) {
    auto& shard = shard_for(endpoint);
    std::unique_lock lock(shard.mutex);
    shard.chains.erase(std::string(endpoint));
}

}  // namespace callguard
