/**
 * @file events.hpp
 * @brief Cluster lifecycle events published to external collaborators.
 */

#pragma once

#include "core/types.hpp"
#include "optimizer/resource_optimizer.hpp"
#include "state/state_manager.hpp"

#include <functional>
#include <variant>

namespace fleet_coordinator {

struct NodeRegistered {
    NodeId node_id;
    NodeAddress address;
    CapabilitySet capabilities;
};

struct NodeLost {
    NodeId node_id;
    LossReason reason;
};

struct NodeStatusChanged {
    NodeId node_id;
    double load;
    NodeStatus status;
};

struct RecommendationIssued {
    Recommendation recommendation;
};

struct PlacementInvalidated {
    Placement placement;
};

struct StateDivergence {
    DivergenceReport report;
};

using ClusterEvent = std::variant<NodeRegistered,
                                  NodeLost,
                                  NodeStatusChanged,
                                  RecommendationIssued,
                                  PlacementInvalidated,
                                  StateDivergence>;

using EventListener = std::function<void(const ClusterEvent&)>;

}  // namespace fleet_coordinator
