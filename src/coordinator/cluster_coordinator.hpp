/**
 * @file cluster_coordinator.hpp
 * @brief Top-level ClusterCoordinator facade that ties all modules together.
 *
 * Provides a single entry point for:
 *   1. Node lifecycle: register, report status, unregister
 *   2. Placement: pick the best node for a capability set
 *   3. Shared state: push/pull versioned per-node state
 *   4. Observability: metrics snapshots and lifecycle events
 *
 * The coordinator owns the NodeRegistry and is the only component that
 * mutates it on behalf of callers. Two background loops run while started:
 * the heartbeat loop (sweep + consistency check) and the optimizer loop.
 */

#pragma once

#include "balancer/load_balancer.hpp"
#include "coordinator/periodic_task.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "health/heartbeat_monitor.hpp"
#include "optimizer/resource_optimizer.hpp"
#include "registry/node_registry.hpp"
#include "state/state_manager.hpp"
#include "telemetry/cluster_metrics.hpp"
#include "telemetry/events.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace fleet_coordinator {

class ClusterCoordinator {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        std::unique_ptr<ILogSink> metrics_sink;     ///< NullSink when empty
        LogLevel log_level = LogLevel::Info;
    };

    explicit ClusterCoordinator(Options opts);
    ~ClusterCoordinator();

    // Non-copyable, non-movable
    ClusterCoordinator(const ClusterCoordinator&) = delete;
    ClusterCoordinator& operator=(const ClusterCoordinator&) = delete;

    // ── Lifecycle ────────────────────────────

    /// Validate configuration and start both background loops.
    Result<void> start();

    /// Cancel both loops and wait for any in-flight iteration.
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Node lifecycle ───────────────────────

    Result<NodeId> register_node(NodeAddress address, CapabilitySet capabilities);
    Result<NodeId> register_node_with_id(const NodeId& id,
                                         NodeAddress address,
                                         CapabilitySet capabilities);

    /// Idempotent; unknown ids are not an error.
    void unregister_node(const NodeId& id);

    Result<void> update_node_status(const NodeId& id, double load, NodeStatus status);
    Result<void> update_capabilities(const NodeId& id, CapabilitySet capabilities);

    [[nodiscard]] std::optional<NodeRecord> get_node(const NodeId& id) const;
    [[nodiscard]] std::vector<NodeRecord> list_nodes() const;

    // ── Placement ────────────────────────────

    Result<Placement> select_node(const PlacementRequest& request);
    bool complete_placement(PlacementId id);

    // ── Shared state ─────────────────────────

    Result<void> push_state(const NodeId& id,
                            Payload payload,
                            uint64_t version,
                            std::string resource_key = {});
    [[nodiscard]] std::optional<ClusterState> pull_state(const NodeId& id) const;
    [[nodiscard]] bool verify_state(const NodeId& id, const Payload& payload) const;

    // ── Resources ────────────────────────────

    void report_resource_usage(ResourceUsage sample);
    Result<void> update_thresholds(const ResourceThresholds& thresholds);

    // ── Loop bodies (driven by the loops, callable directly) ──

    SweepReport run_heartbeat_sweep(SteadyTime now);
    std::vector<DivergenceReport> run_consistency_check();
    Recommendation run_optimization();

    // ── Observability ────────────────────────

    [[nodiscard]] MetricsSnapshot metrics() const;
    void subscribe(EventListener listener);

    // ── Accessors (for testing) ─────────────
    const Config& config() const { return config_; }
    Logger& logger() { return logger_; }
    const StateManager& state() const { return state_; }
    const LoadBalancer& balancer() const { return balancer_; }

private:
    void handle_node_lost(const NodeRecord& record, LossReason reason);
    void publish(const ClusterEvent& event);

    Config config_;
    Logger logger_;
    MetricsCollector collector_;

    NodeRegistry registry_;
    HeartbeatMonitor heartbeat_;
    LoadBalancer balancer_;
    StateManager state_;
    ResourceOptimizer optimizer_;

    PeriodicTask heartbeat_task_;
    PeriodicTask optimizer_task_;

    std::mutex listener_mutex_;
    std::vector<EventListener> listeners_;

    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> sweep_errors_{0};
    std::atomic<bool> running_{false};
};

}  // namespace fleet_coordinator
