/**
 * @file config.hpp
 * @brief Coordinator configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace fleet_coordinator {

struct ClusterConfig {
    uint32_t max_nodes = 64;
    uint32_t min_nodes = 1;
    bool auto_drain = true;            ///< Apply scale-down recommendations by draining
    uint32_t max_pending_placements = 4096;  ///< Oldest placement is dropped beyond this
};

struct HeartbeatConfig {
    uint32_t interval_ms = 10000;
    uint32_t node_timeout_ms = 30000;
    uint32_t drain_timeout_ms = 120000;
};

/**
 * @brief Resource watermarks, all percentages in [0, 100].
 */
struct ResourceThresholds {
    float cpu_high = 80.0f;
    float cpu_low = 20.0f;
    float memory_high = 85.0f;
    float memory_low = 30.0f;
    float disk_high = 90.0f;
};

struct OptimizerConfig {
    uint32_t interval_ms = 60000;
    uint32_t metrics_history_size = 100;
    ResourceThresholds thresholds;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level coordinator configuration.
 */
struct Config {
    ClusterConfig cluster;
    HeartbeatConfig heartbeat;
    OptimizerConfig optimizer;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. The result is not validated; call
 * validate_config() before use.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Check cross-field invariants (min_nodes <= max_nodes, low < high, ...).
 *
 * @return ConfigurationInvalid naming the first violated invariant.
 */
Result<void> validate_config(const Config& config);

/// Threshold-only validation, shared with ResourceOptimizer::update_thresholds.
Result<void> validate_thresholds(const ResourceThresholds& thresholds);

}  // namespace fleet_coordinator
