/**
 * @file node_registry.hpp
 * @brief Authoritative, thread-safe map of node id to NodeRecord.
 *
 * The registry is the only shared mutable structure in the coordinator.
 * Writers take the lock exclusively; readers share it and always leave
 * with copies, never references into the map.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace fleet_coordinator {

class NodeRegistry {
public:
    explicit NodeRegistry(size_t capacity);

    // ── Membership ───────────────────────────

    /// Allocate a fresh id and insert an Active record with load 0.
    Result<NodeId> register_node(NodeAddress address, CapabilitySet capabilities);

    /// Insert under a caller-chosen id, replacing any existing record outright.
    Result<NodeId> register_node_with_id(const NodeId& id,
                                         NodeAddress address,
                                         CapabilitySet capabilities);

    /// Remove if present. Idempotent; returns the removed record marked Dead.
    std::optional<NodeRecord> unregister_node(const NodeId& id);

    // ── Updates ──────────────────────────────

    /// Update load/status and stamp the heartbeat. NotFound if absent.
    Result<void> update_status(const NodeId& id, double load, NodeStatus status);

    Result<void> update_capabilities(const NodeId& id, CapabilitySet capabilities);

    /// Move to Draining without stamping the heartbeat (coordinator-initiated).
    Result<void> begin_drain(const NodeId& id);

    // ── Eviction (HeartbeatMonitor) ──────────

    /**
     * @brief Remove @p id only if its heartbeat is still older than @p timeout at @p now.
     *
     * Re-checked under the write lock: a report that landed after the
     * caller's snapshot keeps the node alive.
     */
    std::optional<NodeRecord> evict_if_stale(const NodeId& id,
                                             SteadyTime now,
                                             Millis timeout);

    /// Remove @p id if it is still Draining.
    std::optional<NodeRecord> evict_draining(const NodeId& id);

    // ── Queries ──────────────────────────────

    [[nodiscard]] std::optional<NodeRecord> get(const NodeId& id) const;
    [[nodiscard]] std::vector<NodeRecord> snapshot_all() const;
    [[nodiscard]] bool contains(const NodeId& id) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    NodeRecord make_record(const NodeId& id,
                           NodeAddress address,
                           CapabilitySet capabilities) const;
    NodeId next_id();

    size_t capacity_;
    uint64_t next_sequence_{1};

    mutable std::shared_mutex mutex_;
    std::map<NodeId, NodeRecord> nodes_;   ///< Ordered: snapshots come out sorted by id
};

}  // namespace fleet_coordinator
