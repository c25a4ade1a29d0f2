/**
 * @file resource_optimizer.cpp
 * @brief ResourceOptimizer: compares aggregate load against watermarks and
 *        recommends adding a node, draining one, or nothing.
 *
 * Aggregate load is the mean load of Active nodes, read as a percentage.
 * The CPU figure compared against the watermarks is the larger of that
 * mean and the latest sampled cpu_percent. Draining nodes are excluded from
 * the mean and from the scale-down count, but they still hold a registry
 * slot and so count against max_nodes.
 */

#include "optimizer/resource_optimizer.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace fleet_coordinator {

namespace {

std::string percent(double value) {
    std::ostringstream oss;
    oss.precision(1);
    oss << std::fixed << value << '%';
    return oss.str();
}

}  // anonymous namespace

ResourceOptimizer::ResourceOptimizer(OptimizerConfig config,
                                     uint32_t min_nodes,
                                     uint32_t max_nodes)
    : config_(config)
    , min_nodes_(min_nodes)
    , max_nodes_(max_nodes) {}

Recommendation ResourceOptimizer::optimize(const std::vector<NodeRecord>& snapshot) const {
    ResourceThresholds th;
    std::optional<ResourceUsage> usage;
    {
        std::lock_guard lock(mutex_);
        th = config_.thresholds;
        if (!history_.empty()) usage = history_.back();
    }

    Recommendation rec;
    rec.computed_at = std::chrono::system_clock::now();

    const NodeRecord* idlest = nullptr;
    double total = 0.0;
    bool draining_in_progress = false;

    for (const auto& record : snapshot) {
        if (record.is_live()) ++rec.live_nodes;
        if (record.status == NodeStatus::Draining) {
            draining_in_progress = true;
            continue;
        }
        if (!record.is_active()) continue;

        total += record.load;
        ++rec.active_nodes;
        if (idlest == nullptr || record.load < idlest->load
            || (record.load == idlest->load && record.id < idlest->id)) {
            idlest = &record;
        }
    }
    rec.aggregate_load = rec.active_nodes > 0
        ? total / static_cast<double>(rec.active_nodes) : 0.0;

    if (usage && usage->disk_percent > th.disk_high) {
        rec.notes.push_back("disk usage " + percent(usage->disk_percent)
                            + " above " + percent(th.disk_high)
                            + ": increase disk space or clean up");
    }

    bool sampled_cpu_dominates = usage && usage->cpu_percent > rec.aggregate_load;
    double cpu = sampled_cpu_dominates ? usage->cpu_percent : rec.aggregate_load;
    std::string cpu_label = sampled_cpu_dominates ? "sampled cpu " : "load ";

    bool cpu_high = cpu > th.cpu_high;
    bool mem_high = usage && usage->memory_percent > th.memory_high;
    bool cpu_low = cpu < th.cpu_low;
    bool mem_low = !usage || usage->memory_percent < th.memory_low;

    if (cpu_high || mem_high) {
        std::string pressure = cpu_high
            ? cpu_label + percent(cpu) + " above " + percent(th.cpu_high)
            : "memory " + percent(usage->memory_percent) + " above " + percent(th.memory_high);

        if (rec.live_nodes < max_nodes_) {
            rec.action = ScalingAction::ScaleUp;
            rec.reason = pressure;
        } else {
            rec.reason = pressure + ", already at max_nodes ("
                         + std::to_string(max_nodes_) + ")";
        }
        return rec;
    }

    if (cpu_low && mem_low && rec.active_nodes > 0) {
        std::string slack = cpu_label + percent(cpu) + " below " + percent(th.cpu_low);
        if (rec.active_nodes <= min_nodes_) {
            rec.reason = slack + ", already at min_nodes (" + std::to_string(min_nodes_) + ")";
        } else if (draining_in_progress) {
            rec.reason = slack + ", drain already in progress";
        } else {
            rec.action = ScalingAction::ScaleDown;
            rec.target_node = idlest->id;
            rec.reason = slack;
        }
        return rec;
    }

    rec.reason = cpu_label + percent(cpu) + " within watermarks";
    return rec;
}

void ResourceOptimizer::record_usage(ResourceUsage sample) {
    if (sample.sampled_at == Timestamp{}) {
        sample.sampled_at = std::chrono::system_clock::now();
    }
    std::lock_guard lock(mutex_);
    history_.push_back(sample);
    while (history_.size() > config_.metrics_history_size) {
        history_.pop_front();
    }
}

std::optional<ResourceUsage> ResourceOptimizer::latest_usage() const {
    std::lock_guard lock(mutex_);
    if (history_.empty()) return std::nullopt;
    return history_.back();
}

std::vector<ResourceUsage> ResourceOptimizer::usage_history() const {
    std::lock_guard lock(mutex_);
    return {history_.begin(), history_.end()};
}

Result<void> ResourceOptimizer::update_thresholds(const ResourceThresholds& thresholds) {
    if (auto valid = validate_thresholds(thresholds); !valid) return valid;
    std::lock_guard lock(mutex_);
    config_.thresholds = thresholds;
    return {};
}

ResourceThresholds ResourceOptimizer::thresholds() const {
    std::lock_guard lock(mutex_);
    return config_.thresholds;
}

}  // namespace fleet_coordinator
