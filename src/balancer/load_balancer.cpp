/**
 * @file load_balancer.cpp
 * @brief LoadBalancer: assigns work to the least-loaded capable node.
 *
 * Algorithm:
 *   For each record in the snapshot:
 *     Skip unless status == Active and capabilities ⊇ required
 *     Keep the record with the lowest load (ties: smallest id)
 *
 * Complexity: O(N × C) where N = nodes, C = required capabilities.
 */

#include "balancer/load_balancer.hpp"

#include <algorithm>
#include <chrono>

namespace fleet_coordinator {

LoadBalancer::LoadBalancer(size_t max_pending)
    : max_pending_(std::max<size_t>(max_pending, 1)) {}

Result<Placement> LoadBalancer::select_node(const PlacementRequest& request,
                                            const std::vector<NodeRecord>& snapshot) {
    const NodeRecord* best = nullptr;

    for (const auto& record : snapshot) {
        if (!record.is_active()) continue;
        if (!satisfies(record.capabilities, request.required)) continue;

        if (best == nullptr
            || record.load < best->load
            || (record.load == best->load && record.id < best->id)) {
            best = &record;
        }
    }

    if (best == nullptr) {
        misses_.fetch_add(1);
        return Error{ErrorCode::NoEligibleNode,
                     "no active node offers [" + join_capabilities(request.required) + "]"};
    }

    Placement placement{
        .placement_id = 0,
        .node_id = best->id,
        .task_tag = request.task_tag,
        .placed_at = std::chrono::steady_clock::now()
    };

    {
        std::lock_guard lock(mutex_);
        placement.placement_id = next_placement_id_++;
        pending_.emplace(placement.placement_id, placement);
        // Ids are monotonic, so the map's first entry is the oldest
        while (pending_.size() > max_pending_) {
            pending_.erase(pending_.begin());
            expired_.fetch_add(1);
        }
    }

    selections_.fetch_add(1);
    return placement;
}

bool LoadBalancer::complete_placement(PlacementId id) {
    std::lock_guard lock(mutex_);
    return pending_.erase(id) > 0;
}

std::vector<Placement> LoadBalancer::invalidate_node(const NodeId& node_id) {
    std::vector<Placement> dropped;
    {
        std::lock_guard lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end(); ) {
            if (it->second.node_id == node_id) {
                dropped.push_back(std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }
    invalidated_.fetch_add(dropped.size());
    return dropped;
}

std::vector<Placement> LoadBalancer::pending_placements() const {
    std::lock_guard lock(mutex_);
    std::vector<Placement> result;
    result.reserve(pending_.size());
    for (const auto& [id, placement] : pending_) {
        result.push_back(placement);
    }
    return result;
}

BalancerStats LoadBalancer::stats() const {
    BalancerStats s;
    s.selections = selections_.load();
    s.misses = misses_.load();
    s.invalidated = invalidated_.load();
    s.expired = expired_.load();
    {
        std::lock_guard lock(mutex_);
        s.pending = pending_.size();
    }
    return s;
}

double LoadBalancer::cluster_load(const std::vector<NodeRecord>& snapshot) {
    double total = 0.0;
    size_t active = 0;
    for (const auto& record : snapshot) {
        if (!record.is_active()) continue;
        total += record.load;
        ++active;
    }
    return active > 0 ? total / static_cast<double>(active) : 0.0;
}

}  // namespace fleet_coordinator
