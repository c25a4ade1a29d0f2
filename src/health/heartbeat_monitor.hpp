/**
 * @file heartbeat_monitor.hpp
 * @brief Liveness sweep over the NodeRegistry.
 *
 * A sweep evicts every node whose last heartbeat is older than the node
 * timeout, and completes drains: a Draining node is evicted once its load
 * reaches zero or its drain has outlived the drain timeout. Listeners are
 * told about each eviction so placements and state can be invalidated.
 *
 * The monitor has no thread of its own; ClusterCoordinator drives sweep()
 * from its heartbeat loop, and tests drive it with an explicit clock value.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "registry/node_registry.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace fleet_coordinator {

using NodeLostCallback = std::function<void(const NodeRecord&, LossReason)>;

struct EvictedNode {
    NodeRecord record;
    LossReason reason;
};

struct SweepReport {
    size_t examined = 0;
    std::vector<EvictedNode> evicted;
    std::vector<std::string> errors;    ///< One entry per node whose handling failed
};

class HeartbeatMonitor {
public:
    HeartbeatMonitor(NodeRegistry& registry,
                     Logger& logger,
                     Millis node_timeout,
                     Millis drain_timeout);

    // Non-copyable
    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    void on_node_lost(NodeLostCallback callback);

    /// Run one sweep as of @p now.
    SweepReport sweep(SteadyTime now);

    [[nodiscard]] Millis node_timeout() const noexcept { return node_timeout_; }
    [[nodiscard]] Millis drain_timeout() const noexcept { return drain_timeout_; }

private:
    void notify_lost(const NodeRecord& record, LossReason reason);

    NodeRegistry& registry_;
    Logger& logger_;
    Millis node_timeout_;
    Millis drain_timeout_;

    std::mutex callback_mutex_;
    std::vector<NodeLostCallback> on_lost_;
};

}  // namespace fleet_coordinator
