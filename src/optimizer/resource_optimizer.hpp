/**
 * @file resource_optimizer.hpp
 * @brief Threshold-based scaling advice from aggregate cluster load.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_coordinator {

/**
 * @brief Resource usage sample supplied by an external metrics source.
 *
 * Percentages in [0, 100].
 */
struct ResourceUsage {
    float cpu_percent{0.0f};
    float memory_percent{0.0f};
    float disk_percent{0.0f};
    Timestamp sampled_at{};
};

enum class ScalingAction : uint8_t {
    None,
    ScaleUp,     ///< Provision one more node
    ScaleDown    ///< Drain target_node
};

[[nodiscard]] constexpr std::string_view to_string(ScalingAction action) noexcept {
    switch (action) {
        case ScalingAction::None:      return "none";
        case ScalingAction::ScaleUp:   return "scale_up";
        case ScalingAction::ScaleDown: return "scale_down";
    }
    return "unknown";
}

struct Recommendation {
    ScalingAction action{ScalingAction::None};
    std::optional<NodeId> target_node;      ///< Set for ScaleDown
    std::string reason;
    std::vector<std::string> notes;         ///< Advisory observations (e.g. disk pressure)
    double aggregate_load{0.0};
    size_t active_nodes{0};
    size_t live_nodes{0};                   ///< Active plus Draining
    Timestamp computed_at{};
};

/**
 * @brief Advisory optimizer. Never mutates the cluster itself.
 *
 * Policy, with cpu = max(mean Active load, sampled cpu_percent):
 *   cpu > cpu_high or memory > memory_high, live < max_nodes     → ScaleUp
 *   cpu < cpu_low and memory < memory_low (if sampled),
 *     active > min_nodes, nothing already draining               → ScaleDown
 *   otherwise                                                    → None
 */
class ResourceOptimizer {
public:
    ResourceOptimizer(OptimizerConfig config, uint32_t min_nodes, uint32_t max_nodes);

    [[nodiscard]] Recommendation optimize(const std::vector<NodeRecord>& snapshot) const;

    /// Append an external usage sample, keeping the newest metrics_history_size.
    void record_usage(ResourceUsage sample);

    [[nodiscard]] std::optional<ResourceUsage> latest_usage() const;
    [[nodiscard]] std::vector<ResourceUsage> usage_history() const;

    /// Replace the thresholds; ConfigurationInvalid leaves the old ones in place.
    Result<void> update_thresholds(const ResourceThresholds& thresholds);
    [[nodiscard]] ResourceThresholds thresholds() const;

private:
    OptimizerConfig config_;
    uint32_t min_nodes_;
    uint32_t max_nodes_;

    mutable std::mutex mutex_;
    std::deque<ResourceUsage> history_;
};

}  // namespace fleet_coordinator
