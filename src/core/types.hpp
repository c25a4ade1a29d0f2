/**
 * @file types.hpp
 * @brief Fundamental types used throughout FleetCoordinator.
 *
 * Defines NodeId, CapabilitySet, NodeRecord and the other vocabulary types
 * shared by the registry, balancer, state manager and optimizer.
 * All types have value semantics; components exchange copies, never handles.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_coordinator {

// ─────────────────────────────────────────────
// Identity & Time
// ─────────────────────────────────────────────

using NodeId = std::string;
using PlacementId = uint64_t;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;
using Millis = std::chrono::milliseconds;

using Payload = std::vector<uint8_t>;

// ─────────────────────────────────────────────
// Capabilities
// ─────────────────────────────────────────────

/**
 * @brief Ordered set of capability tags a node declares (e.g. "gpu", "cpu").
 *
 * Ordered so that log output and snapshots are deterministic.
 */
using CapabilitySet = std::set<std::string>;

/**
 * @brief True when @p offered contains every tag in @p required.
 *
 * An empty requirement is satisfied by any node.
 */
[[nodiscard]] bool satisfies(const CapabilitySet& offered, const CapabilitySet& required);

/// Comma-joined rendering, used in log lines.
[[nodiscard]] std::string join_capabilities(const CapabilitySet& caps);

// ─────────────────────────────────────────────
// Node Address
// ─────────────────────────────────────────────

struct NodeAddress {
    std::string host;
    uint16_t port{0};

    [[nodiscard]] std::string to_string() const {
        return host + ":" + std::to_string(port);
    }

    bool operator==(const NodeAddress&) const = default;
};

// ─────────────────────────────────────────────
// Node Status
// ─────────────────────────────────────────────

enum class NodeStatus : uint8_t {
    Active,      ///< Eligible for placement
    Draining,    ///< Finishing existing work, receives nothing new
    Dead         ///< Evicted or unregistered
};

[[nodiscard]] constexpr std::string_view to_string(NodeStatus status) noexcept {
    switch (status) {
        case NodeStatus::Active:   return "active";
        case NodeStatus::Draining: return "draining";
        case NodeStatus::Dead:     return "dead";
    }
    return "unknown";
}

[[nodiscard]] std::optional<NodeStatus> parse_node_status(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Node Record
// ─────────────────────────────────────────────

/**
 * @brief One cluster member as held by the NodeRegistry.
 *
 * Copies of this struct are what every other component sees.
 */
struct NodeRecord {
    NodeId id;
    NodeAddress address;
    CapabilitySet capabilities;
    double load{0.0};                           ///< Utilization, higher = busier
    NodeStatus status{NodeStatus::Active};
    SteadyTime last_heartbeat{};
    SteadyTime registered_at{};
    std::optional<SteadyTime> drain_started;    ///< Set on entering Draining

    [[nodiscard]] bool is_active() const noexcept { return status == NodeStatus::Active; }
    [[nodiscard]] bool is_live() const noexcept { return status != NodeStatus::Dead; }
};

// ─────────────────────────────────────────────
// Loss Reason
// ─────────────────────────────────────────────

enum class LossReason : uint8_t {
    HeartbeatTimeout,   ///< No report within node_timeout
    Drained,            ///< Draining node reached zero load
    DrainTimeout,       ///< Draining node exceeded drain_timeout
    Unregistered        ///< Explicit caller request
};

[[nodiscard]] constexpr std::string_view to_string(LossReason reason) noexcept {
    switch (reason) {
        case LossReason::HeartbeatTimeout: return "heartbeat_timeout";
        case LossReason::Drained:          return "drained";
        case LossReason::DrainTimeout:     return "drain_timeout";
        case LossReason::Unregistered:     return "unregistered";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Placement
// ─────────────────────────────────────────────

/**
 * @brief A caller's request for a node: the capabilities the work needs.
 *
 * task_tag is opaque to the coordinator and only echoed in placements/logs.
 */
struct PlacementRequest {
    CapabilitySet required;
    std::string task_tag;
};

struct Placement {
    PlacementId placement_id{0};
    NodeId node_id;
    std::string task_tag;
    SteadyTime placed_at{};
};

}  // namespace fleet_coordinator
