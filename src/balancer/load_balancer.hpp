/**
 * @file load_balancer.hpp
 * @brief Capability-aware least-loaded node selection.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace fleet_coordinator {

struct BalancerStats {
    uint64_t selections = 0;
    uint64_t misses = 0;           ///< NoEligibleNode results
    uint64_t invalidated = 0;      ///< Pending placements dropped by node loss
    uint64_t expired = 0;          ///< Oldest placements dropped to respect max_pending
    size_t pending = 0;
};

/**
 * @brief Greedy least-loaded selection over a registry snapshot.
 *
 * Eligible: status Active and capabilities ⊇ required. Among those the
 * minimum load wins, ties broken by smallest id. The balancer keeps no
 * per-node counters of its own; it only remembers the placements it handed
 * out so that they can be invalidated when their node is lost. That ledger
 * holds at most max_pending entries; beyond it the oldest placement is
 * forgotten.
 */
class LoadBalancer {
public:
    static constexpr size_t DEFAULT_MAX_PENDING = 4096;

    explicit LoadBalancer(size_t max_pending = DEFAULT_MAX_PENDING);

    /**
     * @brief Pick a node for @p request from @p snapshot.
     *
     * The caller passes one snapshot; the registry is never re-read
     * mid-decision.
     *
     * @return The recorded placement, or NoEligibleNode.
     */
    Result<Placement> select_node(const PlacementRequest& request,
                                  const std::vector<NodeRecord>& snapshot);

    /// Mark a placement finished. False if it was unknown or already invalidated.
    bool complete_placement(PlacementId id);

    /// Drop and return every pending placement on @p node_id.
    std::vector<Placement> invalidate_node(const NodeId& node_id);

    [[nodiscard]] std::vector<Placement> pending_placements() const;
    [[nodiscard]] BalancerStats stats() const;

    /// Mean load across Active nodes in @p snapshot, 0 when there are none.
    [[nodiscard]] static double cluster_load(const std::vector<NodeRecord>& snapshot);

private:
    mutable std::mutex mutex_;
    std::map<PlacementId, Placement> pending_;
    PlacementId next_placement_id_{1};
    size_t max_pending_;

    std::atomic<uint64_t> selections_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> invalidated_{0};
    std::atomic<uint64_t> expired_{0};
};

}  // namespace fleet_coordinator
