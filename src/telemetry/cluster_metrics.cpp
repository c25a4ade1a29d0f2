/**
 * @file cluster_metrics.cpp
 * @brief Metrics snapshot aggregation.
 */

#include "telemetry/cluster_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

namespace fleet_coordinator {

double percentile(std::vector<double>& values, double pct) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    auto rank = static_cast<size_t>(std::ceil(pct / 100.0 * static_cast<double>(values.size())));
    rank = std::clamp<size_t>(rank, 1, values.size());
    return values[rank - 1];
}

MetricsSnapshot summarize(const std::vector<NodeRecord>& snapshot, size_t max_nodes) {
    MetricsSnapshot m;
    m.total_nodes = snapshot.size();
    m.max_nodes = max_nodes;

    std::vector<double> loads;
    for (const auto& record : snapshot) {
        switch (record.status) {
            case NodeStatus::Active:
                ++m.active_nodes;
                loads.push_back(record.load);
                break;
            case NodeStatus::Draining:
                ++m.draining_nodes;
                break;
            case NodeStatus::Dead:
                break;
        }
    }

    if (!loads.empty()) {
        m.average_load = std::accumulate(loads.begin(), loads.end(), 0.0)
                         / static_cast<double>(loads.size());
        m.p50_load = percentile(loads, 50.0);
        m.p95_load = percentile(loads, 95.0);
        m.max_load = loads.back();   // sorted by percentile()
    }

    m.pool_utilization = max_nodes > 0
        ? static_cast<double>(m.active_nodes) / static_cast<double>(max_nodes)
        : 0.0;
    return m;
}

std::string MetricsSnapshot::to_json() const {
    std::ostringstream oss;
    oss << R"({"total_nodes":)" << total_nodes
        << R"(,"active_nodes":)" << active_nodes
        << R"(,"draining_nodes":)" << draining_nodes
        << R"(,"max_nodes":)" << max_nodes
        << R"(,"avg_load":)" << average_load
        << R"(,"p50_load":)" << p50_load
        << R"(,"p95_load":)" << p95_load
        << R"(,"max_load":)" << max_load
        << R"(,"pool_utilization":)" << pool_utilization
        << R"(,"evictions":)" << evictions
        << R"(,"sweep_errors":)" << sweep_errors
        << R"(,"selections":)" << selections
        << R"(,"selection_misses":)" << selection_misses
        << R"(,"stale_writes":)" << stale_writes
        << R"(,"pending_placements":)" << pending_placements
        << R"(,"state_entries":)" << state_entries
        << "}";
    return oss.str();
}

}  // namespace fleet_coordinator
