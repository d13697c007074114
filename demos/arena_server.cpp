// Arena Server Demo
//
// Simulated multiplayer arena: player threads call remote endpoints through
// the dispatcher while it validates, rate limits, logs and gates them.
//
// Usage:
//   ./callguard_arena [config-file] [--chaos] [--seconds N]
//
// Options:
//   config-file - key=value file (see callguard/config.hpp)
//   --chaos     - Add a cheating client (malformed args, spam, muted chat)
//   --seconds N - Stop after N seconds (default: run until Ctrl+C)

#include "callguard/assertions.hpp"
#include "callguard/config.hpp"
#include "callguard/dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int /*signum*/) {
    g_running = false;
}

// Simple random number generator
class Random {
public:
    explicit Random(std::uint64_t seed) : gen_(static_cast<std::mt19937::result_type>(seed)) {}

    int range(int min, int max) {
        std::uniform_int_distribution<int> dist(min, max);
        return dist(gen_);
    }

    double uniform() {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(gen_);
    }

    template<typename T>
    const T& pick(const std::vector<T>& vec) {
        return vec[range(0, static_cast<int>(vec.size()) - 1)];
    }

private:
    std::mt19937 gen_;
};

const std::vector<std::string> ITEMS = {
    "sword", "shield", "potion", "bow", "arrows", "helmet"
};

const std::vector<std::string> SLOTS = {
    "head", "chest", "hands", "feet", "ring"  // "ring" is not equippable
};

const std::vector<std::string> PHRASES = {
    "gg", "nice shot", "regroup at B", "need healing", "brb"
};

constexpr callguard::CallerId kCheaterId = 666;

// ============================================================================
// Endpoints
// ============================================================================

void register_endpoints(callguard::Dispatcher& dispatcher) {
    auto& log = dispatcher.log();

    dispatcher.register_event("move", {"x", "number", "y", "number"},
        [&log](callguard::CallerId, callguard::LogIndex idx, const callguard::Args& args) {
            callguard::assert_in_range(log, idx, args[0], -500, 500);
            callguard::assert_in_range(log, idx, args[1], -500, 500);
        });

    dispatcher.register_function("buy_item", {"item", "string", "qty", "range[1,10]"},
        [&log](callguard::CallerId, callguard::LogIndex idx, const callguard::Args& args)
            -> std::optional<callguard::Value> {
            if (!callguard::assert_string_pattern(log, idx, args[0], "[a-z]+")) {
                return std::nullopt;
            }
            return callguard::Value(*args[1].as_number() * 25);
        });

    dispatcher.register_event("equip", {"slot", "string"},
        [&log](callguard::CallerId, callguard::LogIndex idx, const callguard::Args& args) {
            callguard::assert_in_list(log, idx, args[0], {"head", "chest", "hands", "feet"});
        });

    dispatcher.register_event("chat", {"text", "string", "channel", "string?"},
        [](callguard::CallerId, callguard::LogIndex, const callguard::Args&) {});

    // Muted players never reach the chat callback
    dispatcher.use("chat", [](const callguard::GateContext& ctx) {
        return ctx.caller != kCheaterId;
    });
    dispatcher.use("chat", [](const callguard::GateContext& ctx) {
        const auto* text = ctx.args.empty() ? nullptr : ctx.args[0].as_string();
        return text == nullptr || text->size() <= 120;
    });

    dispatcher.register_event("report", {"target", "integer", "reason", "string"},
        [](callguard::CallerId, callguard::LogIndex, const callguard::Args&) {},
        callguard::EndpointOptions{.force_logging = true});
}

// ============================================================================
// Clients
// ============================================================================

void run_player(callguard::Dispatcher& dispatcher, callguard::CallerId id) {
    Random rng(id);

    while (g_running) {
        const double roll = rng.uniform();
        if (roll < 0.6) {
            dispatcher.fire(id, "move", {rng.range(-500, 500), rng.range(-500, 500)});
        } else if (roll < 0.75) {
            auto r = dispatcher.invoke(id, "buy_item", {rng.pick(ITEMS), rng.range(1, 10)});
            (void)r;
        } else if (roll < 0.85) {
            dispatcher.fire(id, "equip", {rng.pick(SLOTS)});
        } else if (roll < 0.99) {
            dispatcher.fire(id, "chat", {rng.pick(PHRASES)});
        } else {
            dispatcher.fire(id, "report", {kCheaterId, "speed hacking"});
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(rng.range(20, 120)));
    }
}

void run_cheater(callguard::Dispatcher& dispatcher) {
    Random rng(kCheaterId);

    while (g_running) {
        switch (rng.range(0, 4)) {
            case 0:  // teleport
                dispatcher.fire(kCheaterId, "move", {1e9, "under the map"});
                break;
            case 1: {  // absurd quantity
                auto r = dispatcher.invoke(kCheaterId, "buy_item", {"sword", 9999});
                (void)r;
                break;
            }
            case 2:  // muted
                dispatcher.fire(kCheaterId, "chat", {"buy gold at ..."});
                break;
            case 3:  // endpoint that does not exist
                dispatcher.fire(kCheaterId, "give_admin", {});
                break;
            default:  // spam a valid call past the ceiling
                for (int i = 0; i < 10; ++i) {
                    dispatcher.fire(kCheaterId, "equip", {"head"});
                }
                break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void print_stats(const callguard::Dispatcher& dispatcher) {
    const auto m = dispatcher.metrics();
    const auto log = dispatcher.log().statistics();

    std::fprintf(stderr, "\n--- Stats ---\n");
    std::fprintf(stderr, "Received:          %llu\n", static_cast<unsigned long long>(m.received));
    std::fprintf(stderr, "Completed:         %llu\n", static_cast<unsigned long long>(m.completed));
    std::fprintf(stderr, "Unknown endpoint:  %llu\n",
                 static_cast<unsigned long long>(m.lookup_rejections));
    std::fprintf(stderr, "Middleware:        %llu\n",
                 static_cast<unsigned long long>(m.middleware_rejections));
    std::fprintf(stderr, "Rate limited:      %llu\n",
                 static_cast<unsigned long long>(m.rate_limit_rejections));
    std::fprintf(stderr, "Validation:        %llu\n",
                 static_cast<unsigned long long>(m.validation_rejections));
    std::fprintf(stderr, "Callback errors:   %llu\n",
                 static_cast<unsigned long long>(m.callback_errors));
    std::fprintf(stderr, "Log entries:       %zu / %zu (%zu with errors)\n",
                 log.total_entries, dispatcher.log().capacity(), log.entries_with_errors);
    std::fprintf(stderr, "Evicted:           %llu wraparound, %llu retention\n",
                 static_cast<unsigned long long>(log.wraparound_evictions),
                 static_cast<unsigned long long>(log.compaction_evictions));
    for (const auto& [endpoint, count] : log.per_endpoint) {
        std::fprintf(stderr, "  %-16s %zu\n", endpoint.c_str(), count);
    }
    std::fprintf(stderr, "-------------\n\n");
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse arguments
    const char* config_path = nullptr;
    bool chaos = false;
    long run_seconds = 0;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--chaos") == 0) {
            chaos = true;
        } else if (std::strcmp(argv[i], "--seconds") == 0 && i + 1 < argc) {
            run_seconds = std::atol(argv[++i]);
        } else {
            config_path = argv[i];
        }
    }

    callguard::FirewallConfig config;
    config.max_log_count = 500;
    config.cleanup_interval_sec = 10;
    config.rate_limit_window_sec = 1;
    config.rate_limit_max_requests = 20;

    if (config_path != nullptr) {
        auto loaded = callguard::load_config_file(config_path, config);
        if (const auto* err = std::get_if<callguard::ConfigLoadError>(&loaded)) {
            std::fprintf(stderr, "%s:%zu: %s\n", config_path, err->line,
                         std::string(callguard::to_string(err->error)).c_str());
            return EXIT_FAILURE;
        }
        config = std::get<callguard::FirewallConfig>(loaded);
    }

    auto created = callguard::make_dispatcher(config);
    if (const auto* err = std::get_if<callguard::ConfigError>(&created)) {
        std::fprintf(stderr, "Invalid configuration: %s\n",
                     std::string(callguard::to_string(*err)).c_str());
        return EXIT_FAILURE;
    }
    auto dispatcher = std::move(std::get<std::unique_ptr<callguard::Dispatcher>>(created));

    // Set up signal handler
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    register_endpoints(*dispatcher);
    dispatcher->start();

    std::fprintf(stderr, "Arena open: %zu endpoints, %u calls per %us per endpoint%s\n",
                 dispatcher->endpoint_count(), config.rate_limit_max_requests,
                 config.rate_limit_window_sec, chaos ? " (chaos mode)" : "");
    std::fprintf(stderr, "Press Ctrl+C to stop.\n\n");

    std::vector<std::thread> clients;
    for (callguard::CallerId id = 1; id <= 8; ++id) {
        clients.emplace_back(run_player, std::ref(*dispatcher), id);
    }
    if (chaos) {
        clients.emplace_back(run_cheater, std::ref(*dispatcher));
    }

    const auto started = std::chrono::steady_clock::now();
    auto last_stats_time = started;
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto now = std::chrono::steady_clock::now();
        if (now - last_stats_time >= std::chrono::seconds(1)) {
            print_stats(*dispatcher);
            last_stats_time = now;
        }
        if (run_seconds > 0 && now - started >= std::chrono::seconds(run_seconds)) {
            g_running = false;
        }
    }

    std::fprintf(stderr, "\nShutting down...\n");
    for (auto& t : clients) {
        t.join();
    }
    dispatcher->stop();

    // Final stats
    print_stats(*dispatcher);

    if (chaos) {
        const auto flagged = dispatcher->log().retrieve_by_sender(kCheaterId);
        std::fprintf(stderr, "Cheater has %zu logged calls\n", flagged.size());
    }

    std::fprintf(stderr, "Goodbye.\n");
    return EXIT_SUCCESS;
}
