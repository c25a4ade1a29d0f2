/**
 * @file heartbeat_monitor.cpp
 * @brief HeartbeatMonitor implementation.
 *
 * Algorithm per sweep:
 *   1. Snapshot the registry.
 *   2. Mark nodes silent for longer than node_timeout, and Draining nodes
 *      that are idle or past drain_timeout.
 *   3. Evict each marked node (staleness re-checked under the registry
 *      lock), then notify listeners.
 * A failure while handling one node is recorded and the sweep moves on.
 */

#include "health/heartbeat_monitor.hpp"

#include <exception>
#include <optional>

namespace fleet_coordinator {

namespace {

struct Candidate {
    NodeId id;
    LossReason reason;
};

std::optional<LossReason> classify(const NodeRecord& record,
                                   SteadyTime now,
                                   Millis node_timeout,
                                   Millis drain_timeout) {
    if (now - record.last_heartbeat > node_timeout) {
        return LossReason::HeartbeatTimeout;
    }
    if (record.status == NodeStatus::Draining) {
        if (record.load <= 0.0) return LossReason::Drained;
        if (record.drain_started && now - *record.drain_started > drain_timeout) {
            return LossReason::DrainTimeout;
        }
    }
    return std::nullopt;
}

}  // anonymous namespace

HeartbeatMonitor::HeartbeatMonitor(NodeRegistry& registry,
                                   Logger& logger,
                                   Millis node_timeout,
                                   Millis drain_timeout)
    : registry_(registry)
    , logger_(logger)
    , node_timeout_(node_timeout)
    , drain_timeout_(drain_timeout) {}

void HeartbeatMonitor::on_node_lost(NodeLostCallback callback) {
    std::lock_guard lock(callback_mutex_);
    on_lost_.push_back(std::move(callback));
}

SweepReport HeartbeatMonitor::sweep(SteadyTime now) {
    SweepReport report;

    auto records = registry_.snapshot_all();
    report.examined = records.size();

    std::vector<Candidate> candidates;
    for (const auto& record : records) {
        if (auto reason = classify(record, now, node_timeout_, drain_timeout_)) {
            candidates.push_back({record.id, *reason});
        }
    }

    for (const auto& candidate : candidates) {
        try {
            std::optional<NodeRecord> removed;
            if (candidate.reason == LossReason::HeartbeatTimeout) {
                removed = registry_.evict_if_stale(candidate.id, now, node_timeout_);
            } else {
                removed = registry_.evict_draining(candidate.id);
            }

            // Reported in, re-activated or unregistered since the snapshot
            if (!removed) continue;

            logger_.warn("Node " + candidate.id + " evicted: "
                         + std::string{to_string(candidate.reason)});
            report.evicted.push_back({*removed, candidate.reason});
            notify_lost(*removed, candidate.reason);

        } catch (const std::exception& ex) {
            logger_.error("Sweep failed for node " + candidate.id + ": " + ex.what());
            report.errors.push_back(candidate.id + ": " + ex.what());
        }
    }

    if (!report.evicted.empty()) {
        logger_.info("Heartbeat sweep: " + std::to_string(report.evicted.size())
                     + " of " + std::to_string(report.examined) + " nodes evicted");
    }
    return report;
}

void HeartbeatMonitor::notify_lost(const NodeRecord& record, LossReason reason) {
    std::vector<NodeLostCallback> callbacks;
    {
        std::lock_guard lock(callback_mutex_);
        callbacks = on_lost_;
    }
    for (const auto& cb : callbacks) {
        cb(record, reason);
    }
}

}  // namespace fleet_coordinator
