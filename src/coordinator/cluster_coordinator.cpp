/**
 * @file cluster_coordinator.cpp
 * @brief ClusterCoordinator implementation.
 */

#include "coordinator/cluster_coordinator.hpp"

#include "telemetry/json_sink.hpp"

#include <chrono>
#include <exception>

namespace fleet_coordinator {

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

ClusterCoordinator::ClusterCoordinator(Options opts)
    : config_(std::move(opts.config))
    , logger_(std::move(opts.log_sink), opts.log_level, "coordinator")
    , collector_(opts.metrics_sink ? std::move(opts.metrics_sink)
                                   : std::make_unique<NullSink>())
    , registry_(config_.cluster.max_nodes)
    , heartbeat_(registry_, logger_,
                 Millis{config_.heartbeat.node_timeout_ms},
                 Millis{config_.heartbeat.drain_timeout_ms})
    , balancer_(config_.cluster.max_pending_placements)
    , state_(registry_)
    , optimizer_(config_.optimizer, config_.cluster.min_nodes, config_.cluster.max_nodes)
    , heartbeat_task_("heartbeat", Millis{config_.heartbeat.interval_ms},
                      [this] {
                          run_heartbeat_sweep(std::chrono::steady_clock::now());
                          run_consistency_check();
                      },
                      logger_)
    , optimizer_task_("optimizer", Millis{config_.optimizer.interval_ms},
                      [this] { run_optimization(); },
                      logger_) {
    heartbeat_.on_node_lost([this](const NodeRecord& record, LossReason reason) {
        handle_node_lost(record, reason);
    });
}

ClusterCoordinator::~ClusterCoordinator() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> ClusterCoordinator::start() {
    if (auto valid = validate_config(config_); !valid) {
        logger_.error("Refusing to start: " + valid.error().message);
        return valid;
    }
    if (running_.exchange(true)) {
        return Error{ErrorCode::AlreadyRunning, "coordinator already running"};
    }

    logger_.info("Coordinator starting: max_nodes=" + std::to_string(config_.cluster.max_nodes)
                 + " node_timeout=" + std::to_string(config_.heartbeat.node_timeout_ms) + "ms"
                 + " heartbeat_interval=" + std::to_string(config_.heartbeat.interval_ms) + "ms"
                 + " optimization_interval=" + std::to_string(config_.optimizer.interval_ms) + "ms");

    heartbeat_task_.start();
    optimizer_task_.start();

    logger_.info("Coordinator started");
    return {};
}

void ClusterCoordinator::stop() {
    if (!running_.exchange(false)) return;

    logger_.info("Coordinator shutting down...");
    heartbeat_task_.stop();
    optimizer_task_.stop();
    collector_.flush();
    logger_.info("Coordinator stopped");
    logger_.flush();
}

// ─────────────────────────────────────────────
// Node Lifecycle
// ─────────────────────────────────────────────

Result<NodeId> ClusterCoordinator::register_node(NodeAddress address, CapabilitySet capabilities) {
    auto result = registry_.register_node(address, capabilities);
    if (!result) {
        logger_.warn("Registration of " + address.to_string() + " refused: "
                     + result.error().message);
        return result;
    }

    logger_.info("Registered node " + *result + " at " + address.to_string()
                 + " [" + join_capabilities(capabilities) + "]");
    publish(NodeRegistered{*result, std::move(address), std::move(capabilities)});
    return result;
}

Result<NodeId> ClusterCoordinator::register_node_with_id(const NodeId& id,
                                                         NodeAddress address,
                                                         CapabilitySet capabilities) {
    bool replacing = registry_.contains(id);
    auto result = registry_.register_node_with_id(id, address, capabilities);
    if (!result) {
        logger_.warn("Registration of " + id + " refused: " + result.error().message);
        return result;
    }

    if (replacing) {
        // The previous incarnation's placements and state do not carry over
        for (auto& placement : balancer_.invalidate_node(id)) {
            publish(PlacementInvalidated{std::move(placement)});
        }
        state_.on_node_lost(id);
        logger_.info("Re-registered node " + id + " at " + address.to_string());
    } else {
        logger_.info("Registered node " + id + " at " + address.to_string()
                     + " [" + join_capabilities(capabilities) + "]");
    }
    publish(NodeRegistered{id, std::move(address), std::move(capabilities)});
    return result;
}

void ClusterCoordinator::unregister_node(const NodeId& id) {
    auto removed = registry_.unregister_node(id);
    if (!removed) {
        logger_.debug("Unregister of unknown node " + id + " ignored");
        return;
    }
    logger_.info("Unregistered node " + id);
    handle_node_lost(*removed, LossReason::Unregistered);
}

Result<void> ClusterCoordinator::update_node_status(const NodeId& id,
                                                    double load,
                                                    NodeStatus status) {
    auto result = registry_.update_status(id, load, status);
    if (!result) {
        logger_.debug("Status report from " + id + " rejected: " + result.error().message);
        return result;
    }
    publish(NodeStatusChanged{id, load, status});
    return result;
}

Result<void> ClusterCoordinator::update_capabilities(const NodeId& id, CapabilitySet capabilities) {
    auto summary = join_capabilities(capabilities);
    auto result = registry_.update_capabilities(id, std::move(capabilities));
    if (result) {
        logger_.info("Node " + id + " capabilities now [" + summary + "]");
    }
    return result;
}

std::optional<NodeRecord> ClusterCoordinator::get_node(const NodeId& id) const {
    return registry_.get(id);
}

std::vector<NodeRecord> ClusterCoordinator::list_nodes() const {
    return registry_.snapshot_all();
}

// ─────────────────────────────────────────────
// Placement
// ─────────────────────────────────────────────

Result<Placement> ClusterCoordinator::select_node(const PlacementRequest& request) {
    auto snapshot = registry_.snapshot_all();
    auto result = balancer_.select_node(request, snapshot);

    if (result) {
        logger_.debug("Placed " + (request.task_tag.empty() ? std::string{"task"} : request.task_tag)
                      + " on " + result->node_id);
    } else {
        logger_.warn(result.error().message);
    }
    return result;
}

bool ClusterCoordinator::complete_placement(PlacementId id) {
    return balancer_.complete_placement(id);
}

// ─────────────────────────────────────────────
// Shared State
// ─────────────────────────────────────────────

Result<void> ClusterCoordinator::push_state(const NodeId& id,
                                            Payload payload,
                                            uint64_t version,
                                            std::string resource_key) {
    auto result = state_.push_state(id, std::move(payload), version, std::move(resource_key));
    if (!result) {
        logger_.debug("State push from " + id + " rejected: " + result.error().message);
    }
    return result;
}

std::optional<ClusterState> ClusterCoordinator::pull_state(const NodeId& id) const {
    return state_.pull_state(id);
}

bool ClusterCoordinator::verify_state(const NodeId& id, const Payload& payload) const {
    return state_.verify_state(id, payload);
}

// ─────────────────────────────────────────────
// Resources
// ─────────────────────────────────────────────

void ClusterCoordinator::report_resource_usage(ResourceUsage sample) {
    optimizer_.record_usage(sample);
}

Result<void> ClusterCoordinator::update_thresholds(const ResourceThresholds& thresholds) {
    auto result = optimizer_.update_thresholds(thresholds);
    if (result) {
        logger_.info("Resource thresholds updated");
    } else {
        logger_.warn("Threshold update rejected: " + result.error().message);
    }
    return result;
}

// ─────────────────────────────────────────────
// Loop Bodies
// ─────────────────────────────────────────────

SweepReport ClusterCoordinator::run_heartbeat_sweep(SteadyTime now) {
    auto report = heartbeat_.sweep(now);
    if (!report.errors.empty()) {
        sweep_errors_.fetch_add(report.errors.size());
    }
    if (!report.evicted.empty() || !report.errors.empty()) {
        collector_.record_sweep(report);
    }
    return report;
}

std::vector<DivergenceReport> ClusterCoordinator::run_consistency_check() {
    auto reports = state_.consistency_check();
    for (const auto& report : reports) {
        if (report.kind == DivergenceReport::Kind::Conflict) {
            logger_.warn("State conflict on " + report.resource_key + ": "
                         + report.detail + ", winner " + report.node_id
                         + " v" + std::to_string(report.winning_version));
        } else {
            logger_.info("Collected orphaned state of " + report.node_id);
        }
        publish(StateDivergence{report});
    }
    return reports;
}

Recommendation ClusterCoordinator::run_optimization() {
    auto snapshot = registry_.snapshot_all();
    auto rec = optimizer_.optimize(snapshot);

    if (rec.action != ScalingAction::None) {
        logger_.info("Recommendation: " + std::string{to_string(rec.action)}
                     + (rec.target_node ? " " + *rec.target_node : std::string{})
                     + " (" + rec.reason + ")");
    } else {
        logger_.debug("Recommendation: none (" + rec.reason + ")");
    }
    for (const auto& note : rec.notes) {
        logger_.warn(note);
    }
    publish(RecommendationIssued{rec});
    collector_.record_metrics(metrics());

    if (rec.action == ScalingAction::ScaleDown && rec.target_node && config_.cluster.auto_drain) {
        if (auto drained = registry_.begin_drain(*rec.target_node); drained) {
            auto record = registry_.get(*rec.target_node);
            double load = record ? record->load : 0.0;
            logger_.info("Draining node " + *rec.target_node);
            publish(NodeStatusChanged{*rec.target_node, load, NodeStatus::Draining});
        } else {
            // Lost between snapshot and drain; the next cycle re-evaluates
            logger_.debug("Drain target vanished: " + drained.error().message);
        }
    }
    return rec;
}

// ─────────────────────────────────────────────
// Observability
// ─────────────────────────────────────────────

MetricsSnapshot ClusterCoordinator::metrics() const {
    auto snapshot = summarize(registry_.snapshot_all(), config_.cluster.max_nodes);
    auto balancer = balancer_.stats();

    snapshot.evictions = evictions_.load();
    snapshot.sweep_errors = sweep_errors_.load();
    snapshot.selections = balancer.selections;
    snapshot.selection_misses = balancer.misses;
    snapshot.pending_placements = balancer.pending;
    snapshot.stale_writes = state_.stale_writes();
    snapshot.state_entries = state_.size();
    return snapshot;
}

void ClusterCoordinator::subscribe(EventListener listener) {
    std::lock_guard lock(listener_mutex_);
    listeners_.push_back(std::move(listener));
}

// ─────────────────────────────────────────────
// Internals
// ─────────────────────────────────────────────

void ClusterCoordinator::handle_node_lost(const NodeRecord& record, LossReason reason) {
    if (reason != LossReason::Unregistered) {
        evictions_.fetch_add(1);
    }

    for (auto& placement : balancer_.invalidate_node(record.id)) {
        logger_.warn("Placement " + std::to_string(placement.placement_id)
                     + " on lost node " + record.id + " invalidated");
        publish(PlacementInvalidated{std::move(placement)});
    }
    state_.on_node_lost(record.id);
    publish(NodeLost{record.id, reason});
}

void ClusterCoordinator::publish(const ClusterEvent& event) {
    collector_.record_event(event);

    std::vector<EventListener> listeners;
    {
        std::lock_guard lock(listener_mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& ex) {
            logger_.error(std::string{"Event listener failed: "} + ex.what());
        }
    }
}

}  // namespace fleet_coordinator
