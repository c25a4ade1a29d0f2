/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "health/heartbeat_monitor.hpp"
#include "telemetry/cluster_metrics.hpp"
#include "telemetry/events.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace fleet_coordinator {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_event(const ClusterEvent& event);
    void record_sweep(const SweepReport& report);
    void record_metrics(const MetricsSnapshot& snapshot);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace fleet_coordinator
