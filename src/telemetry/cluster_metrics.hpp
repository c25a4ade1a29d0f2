/**
 * @file cluster_metrics.hpp
 * @brief Point-in-time health and load metrics for the whole cluster.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fleet_coordinator {

struct MetricsSnapshot {
    // Membership
    size_t total_nodes = 0;
    size_t active_nodes = 0;
    size_t draining_nodes = 0;
    size_t max_nodes = 0;

    // Load distribution over Active nodes
    double average_load = 0.0;
    double p50_load = 0.0;
    double p95_load = 0.0;
    double max_load = 0.0;

    double pool_utilization = 0.0;    ///< active_nodes / max_nodes

    // Counters since start
    uint64_t evictions = 0;
    uint64_t sweep_errors = 0;
    uint64_t selections = 0;
    uint64_t selection_misses = 0;
    uint64_t stale_writes = 0;
    size_t pending_placements = 0;
    size_t state_entries = 0;

    [[nodiscard]] std::string to_json() const;
};

/**
 * @brief Fill the membership and load fields of a MetricsSnapshot from @p snapshot.
 *
 * Counters are left zero for the caller to fill.
 */
[[nodiscard]] MetricsSnapshot summarize(const std::vector<NodeRecord>& snapshot, size_t max_nodes);

/// Nearest-rank percentile of @p values (sorted in place); 0 when empty.
[[nodiscard]] double percentile(std::vector<double>& values, double pct);

}  // namespace fleet_coordinator
