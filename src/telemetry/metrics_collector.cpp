/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>
#include <type_traits>

namespace fleet_coordinator {

namespace {

std::string json_quoted(std::string_view text) {
    return "\"" + json_escape(text) + "\"";
}

template <typename Range>
std::string json_array(const Range& items) {
    std::string out = "[";
    bool first = true;
    for (const auto& item : items) {
        if (!first) out += ',';
        out += json_quoted(item);
        first = false;
    }
    return out + "]";
}

}  // anonymous namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_event(const ClusterEvent& event) {
    std::ostringstream oss;

    std::visit([&oss](const auto& e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, NodeRegistered>) {
            oss << R"({"event":"node_registered")"
                << R"(,"node":)" << json_quoted(e.node_id)
                << R"(,"address":)" << json_quoted(e.address.to_string())
                << R"(,"capabilities":)" << json_array(e.capabilities)
                << "}";
        } else if constexpr (std::is_same_v<T, NodeLost>) {
            oss << R"({"event":"node_lost")"
                << R"(,"node":)" << json_quoted(e.node_id)
                << R"(,"reason":)" << json_quoted(to_string(e.reason))
                << "}";
        } else if constexpr (std::is_same_v<T, NodeStatusChanged>) {
            oss << R"({"event":"node_status_changed")"
                << R"(,"node":)" << json_quoted(e.node_id)
                << R"(,"load":)" << e.load
                << R"(,"status":)" << json_quoted(to_string(e.status))
                << "}";
        } else if constexpr (std::is_same_v<T, RecommendationIssued>) {
            const auto& r = e.recommendation;
            oss << R"({"event":"recommendation")"
                << R"(,"action":)" << json_quoted(to_string(r.action))
                << R"(,"target":)" << (r.target_node ? json_quoted(*r.target_node) : "null")
                << R"(,"load":)" << r.aggregate_load
                << R"(,"active_nodes":)" << r.active_nodes
                << R"(,"live_nodes":)" << r.live_nodes
                << R"(,"reason":)" << json_quoted(r.reason)
                << R"(,"notes":)" << json_array(r.notes)
                << "}";
        } else if constexpr (std::is_same_v<T, PlacementInvalidated>) {
            oss << R"({"event":"placement_invalidated")"
                << R"(,"placement":)" << e.placement.placement_id
                << R"(,"node":)" << json_quoted(e.placement.node_id)
                << R"(,"task":)" << json_quoted(e.placement.task_tag)
                << "}";
        } else if constexpr (std::is_same_v<T, StateDivergence>) {
            oss << R"({"event":"state_divergence")"
                << R"(,"kind":)" << json_quoted(to_string(e.report.kind))
                << R"(,"node":)" << json_quoted(e.report.node_id)
                << R"(,"resource":)" << json_quoted(e.report.resource_key)
                << R"(,"involved":)" << json_array(e.report.involved)
                << R"(,"version":)" << e.report.winning_version
                << "}";
        }
    }, event);

    emit(oss.str());
}

void MetricsCollector::record_sweep(const SweepReport& report) {
    std::ostringstream oss;
    oss << R"({"event":"heartbeat_sweep")"
        << R"(,"examined":)" << report.examined
        << R"(,"evicted":)" << report.evicted.size()
        << R"(,"errors":)" << json_array(report.errors)
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_metrics(const MetricsSnapshot& snapshot) {
    record_custom("metrics", snapshot.to_json());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace fleet_coordinator
