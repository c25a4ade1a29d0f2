/**
 * @file node_registry.cpp
 * @brief NodeRegistry implementation.
 */

#include "registry/node_registry.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace fleet_coordinator {

NodeRegistry::NodeRegistry(size_t capacity)
    : capacity_(capacity) {}

NodeRecord NodeRegistry::make_record(const NodeId& id,
                                     NodeAddress address,
                                     CapabilitySet capabilities) const {
    auto now = std::chrono::steady_clock::now();
    NodeRecord record;
    record.id = id;
    record.address = std::move(address);
    record.capabilities = std::move(capabilities);
    record.load = 0.0;
    record.status = NodeStatus::Active;
    record.last_heartbeat = now;
    record.registered_at = now;
    return record;
}

// Caller holds the write lock.
NodeId NodeRegistry::next_id() {
    NodeId id;
    do {
        std::ostringstream oss;
        oss << "node-" << std::setw(8) << std::setfill('0') << next_sequence_++;
        id = oss.str();
    } while (nodes_.count(id) > 0);
    return id;
}

// ─────────────────────────────────────────────
// Membership
// ─────────────────────────────────────────────

Result<NodeId> NodeRegistry::register_node(NodeAddress address, CapabilitySet capabilities) {
    std::unique_lock lock(mutex_);
    if (nodes_.size() >= capacity_) {
        return Error{ErrorCode::CapacityExceeded,
                     "registry full (" + std::to_string(capacity_) + " nodes)"};
    }
    auto id = next_id();
    nodes_.emplace(id, make_record(id, std::move(address), std::move(capabilities)));
    return id;
}

Result<NodeId> NodeRegistry::register_node_with_id(const NodeId& id,
                                                   NodeAddress address,
                                                   CapabilitySet capabilities) {
    if (id.empty()) {
        return Error{ErrorCode::InvalidArgument, "node id must not be empty"};
    }

    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end() && nodes_.size() >= capacity_) {
        return Error{ErrorCode::CapacityExceeded,
                     "registry full (" + std::to_string(capacity_) + " nodes)"};
    }
    // Re-registration is a brand-new record: nothing carries over
    nodes_.insert_or_assign(id, make_record(id, std::move(address), std::move(capabilities)));
    return id;
}

std::optional<NodeRecord> NodeRegistry::unregister_node(const NodeId& id) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;

    NodeRecord removed = std::move(it->second);
    nodes_.erase(it);
    removed.status = NodeStatus::Dead;
    return removed;
}

// ─────────────────────────────────────────────
// Updates
// ─────────────────────────────────────────────

Result<void> NodeRegistry::update_status(const NodeId& id, double load, NodeStatus status) {
    if (!std::isfinite(load) || load < 0.0) {
        return Error{ErrorCode::InvalidArgument, "load must be a finite value >= 0"};
    }
    if (status == NodeStatus::Dead) {
        return Error{ErrorCode::InvalidArgument,
                     "dead is assigned by eviction or unregistration only"};
    }

    auto now = std::chrono::steady_clock::now();

    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorCode::NotFound, "unknown node: " + id};
    }

    auto& record = it->second;
    if (status == NodeStatus::Draining && record.status != NodeStatus::Draining) {
        record.drain_started = now;
    } else if (status == NodeStatus::Active) {
        record.drain_started.reset();
    }
    record.load = load;
    record.status = status;
    record.last_heartbeat = std::max(record.last_heartbeat, now);
    return {};
}

Result<void> NodeRegistry::update_capabilities(const NodeId& id, CapabilitySet capabilities) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorCode::NotFound, "unknown node: " + id};
    }
    it->second.capabilities = std::move(capabilities);
    return {};
}

Result<void> NodeRegistry::begin_drain(const NodeId& id) {
    auto now = std::chrono::steady_clock::now();

    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorCode::NotFound, "unknown node: " + id};
    }
    if (it->second.status != NodeStatus::Draining) {
        it->second.status = NodeStatus::Draining;
        it->second.drain_started = now;
    }
    return {};
}

// ─────────────────────────────────────────────
// Eviction
// ─────────────────────────────────────────────

std::optional<NodeRecord> NodeRegistry::evict_if_stale(const NodeId& id,
                                                       SteadyTime now,
                                                       Millis timeout) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;
    if (now - it->second.last_heartbeat <= timeout) return std::nullopt;

    NodeRecord removed = std::move(it->second);
    nodes_.erase(it);
    removed.status = NodeStatus::Dead;
    return removed;
}

std::optional<NodeRecord> NodeRegistry::evict_draining(const NodeId& id) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end() || it->second.status != NodeStatus::Draining) {
        return std::nullopt;
    }

    NodeRecord removed = std::move(it->second);
    nodes_.erase(it);
    removed.status = NodeStatus::Dead;
    return removed;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::optional<NodeRecord> NodeRegistry::get(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;
    return it->second;
}

std::vector<NodeRecord> NodeRegistry::snapshot_all() const {
    std::shared_lock lock(mutex_);
    std::vector<NodeRecord> records;
    records.reserve(nodes_.size());
    for (const auto& [id, record] : nodes_) {
        records.push_back(record);
    }
    return records;
}

bool NodeRegistry::contains(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    return nodes_.count(id) > 0;
}

size_t NodeRegistry::size() const {
    std::shared_lock lock(mutex_);
    return nodes_.size();
}

}  // namespace fleet_coordinator
