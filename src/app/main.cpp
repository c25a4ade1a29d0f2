/**
 * @file main.cpp
 * @brief FleetCoordinator daemon entry point.
 *
 * Wires the modules into a running coordinator:
 *   Config → Logger → Telemetry → ClusterCoordinator (heartbeat + optimizer loops)
 */

#include "coordinator/cluster_coordinator.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <tuple>
#include <utility>

using namespace fleet_coordinator;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║         FleetCoordinator v1.0.0           ║
  ║   Node registry, placement and state      ║
  ║   sync for distributed worker fleets      ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: fleet_coordinator [OPTIONS]\n"
                      << "  --config <path>    Configuration file (default: config/default.toml)\n"
                      << "  --log-dir <path>   Log output directory (empty: stdout)\n"
                      << "  --demo             Run a simulated fleet walkthrough, then exit\n"
                      << "  --help, -h         Show this help message\n";
            std::exit(0);
        } else {
            std::cerr << "Ignoring unknown argument: " << arg << std::endl;
        }
    }
    return args;
}

/**
 * @brief Drive a simulated fleet through every coordinator operation.
 *
 * Loops are never started here; sweeps and optimization cycles are driven
 * directly with a synthetic clock so the walkthrough finishes immediately.
 */
int run_demo(ClusterCoordinator& coordinator) {
    auto& logger = coordinator.logger();
    logger.info("=== Demo Mode ===");

    coordinator.subscribe([&logger](const ClusterEvent& event) {
        if (const auto* lost = std::get_if<NodeLost>(&event)) {
            logger.warn("Event: node " + lost->node_id + " lost ("
                        + std::string{to_string(lost->reason)} + ")");
        }
    });

    // Three workers, one of them with a GPU
    auto a = coordinator.register_node({"10.0.0.1", 7000}, {"cpu"});
    auto b = coordinator.register_node({"10.0.0.2", 7000}, {"cpu", "gpu"});
    auto c = coordinator.register_node({"10.0.0.3", 7000}, {"cpu", "gpu", "nvme"});
    if (!a || !b || !c) {
        logger.error("Demo registration failed");
        return 1;
    }

    for (const auto& [id, load] : {std::pair{*a, 85.0}, std::pair{*b, 90.0}, std::pair{*c, 95.0}}) {
        if (auto reported = coordinator.update_node_status(id, load, NodeStatus::Active); !reported) {
            logger.warn("Status report for " + id + " failed: " + reported.error().message);
        }
    }

    // Placement: least-loaded GPU node wins
    auto placement = coordinator.select_node({.required = {"gpu"}, .task_tag = "inference"});
    if (placement) {
        logger.info("GPU task placed on " + placement->node_id
                    + " (placement " + std::to_string(placement->placement_id) + ")");
    }
    auto miss = coordinator.select_node({.required = {"tpu"}, .task_tag = "training"});
    if (!miss) {
        logger.info("TPU task: " + std::string{to_string(miss.error().code)});
    }

    // State sync: a stale write is rejected, the newer one is kept
    Payload model_v1{'w', 'e', 'i', 'g', 'h', 't', 's', '1'};
    Payload model_v2{'w', 'e', 'i', 'g', 'h', 't', 's', '2'};
    for (const auto& [id, payload, version] : {std::tuple{*b, model_v1, uint64_t{1}},
                                                std::tuple{*c, model_v2, uint64_t{2}}}) {
        if (auto pushed = coordinator.push_state(id, payload, version, "model/resnet"); !pushed) {
            logger.warn("State push from " + id + " failed: " + pushed.error().message);
        }
    }
    if (auto stale = coordinator.push_state(*b, model_v1, 1, "model/resnet"); !stale) {
        logger.info("Stale push rejected: " + stale.error().message);
    }
    for (const auto& report : coordinator.run_consistency_check()) {
        logger.info("Divergence on " + report.resource_key + " resolved to "
                    + report.node_id + " v" + std::to_string(report.winning_version));
    }

    // Optimization: a hot fleet asks for another node
    coordinator.report_resource_usage({.cpu_percent = 92.0f,
                                       .memory_percent = 60.0f,
                                       .disk_percent = 95.0f,
                                       .sampled_at = std::chrono::system_clock::now()});
    auto rec = coordinator.run_optimization();
    logger.info("Optimizer: " + std::string{to_string(rec.action)} + " (" + rec.reason + ")");

    // Eviction: the whole fleet goes silent past the node timeout
    auto timeout = Millis{coordinator.config().heartbeat.node_timeout_ms};
    auto later = std::chrono::steady_clock::now() + timeout + Millis{1};
    auto sweep = coordinator.run_heartbeat_sweep(later);
    logger.info("Sweep examined " + std::to_string(sweep.examined) + " nodes, evicted "
                + std::to_string(sweep.evicted.size()));
    coordinator.run_consistency_check();

    logger.info("Metrics: " + coordinator.metrics().to_json());
    logger.info("=== Demo Complete ===");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        if (!config_result.error().is(ErrorCode::NotFound)) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return 1;
        }
        std::cerr << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 1;
    }

    // ── Initialize Logger + Telemetry ────────
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);

    ClusterCoordinator::Options opts;
    opts.config = config;
    opts.log_level = level;
    if (!config.telemetry.log_dir.empty() && !args.demo_mode) {
        opts.log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir,
                                                       "fleet_coordinator",
                                                       config.telemetry.max_file_size_mb,
                                                       config.telemetry.rotate_count);
        opts.metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir,
                                                           "fleet_events",
                                                           config.telemetry.max_file_size_mb,
                                                           config.telemetry.rotate_count);
    } else {
        opts.log_sink = std::make_unique<StdoutSink>();
    }

    ClusterCoordinator coordinator(std::move(opts));
    auto& logger = coordinator.logger();
    logger.info("FleetCoordinator starting...");
    logger.info("Config: " + args.config_path.string());

    // ── Demo mode shortcut ───────────────────
    if (args.demo_mode) {
        return run_demo(coordinator);
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (auto started = coordinator.start(); !started) {
        logger.error("Startup failed: " + started.error().message);
        return 1;
    }

    // ── Main Loop ────────────────────────────
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    // Status line once per optimization interval
    const auto status_period = Millis{config.optimizer.interval_ms};
    auto next_status = std::chrono::steady_clock::now() + status_period;

    while (!g_shutdown_requested) {
        if (std::chrono::steady_clock::now() >= next_status) {
            auto snapshot = coordinator.metrics();
            logger.info("Status: " + std::to_string(snapshot.active_nodes) + " active, "
                        + std::to_string(snapshot.draining_nodes) + " draining, avg load "
                        + std::to_string(snapshot.average_load) + ", "
                        + std::to_string(snapshot.evictions) + " evictions");
            next_status += status_period;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    coordinator.stop();

    logger.info("FleetCoordinator stopped.");
    return 0;
}
