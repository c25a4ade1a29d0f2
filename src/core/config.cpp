/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string_view>

namespace fleet_coordinator {

namespace {

Result<void> invalid(std::string message) {
    return Error{ErrorCode::ConfigurationInvalid, std::move(message)};
}

bool is_percent(float value) {
    return value >= 0.0f && value <= 100.0f;
}

struct CountKey {
    std::string_view key;
    uint32_t* field;    ///< Holds the default on entry
};

/**
 * @brief Read positive 32-bit integer keys of one TOML section.
 *
 * Values are read as int64 and range-checked so that a negative or
 * oversized entry is rejected instead of wrapping.
 */
Result<void> read_counts(toml::node_view<toml::node> section,
                         std::string_view section_name,
                         std::initializer_list<CountKey> keys) {
    for (const auto& [key, field] : keys) {
        auto node = section[key];
        if (!node) continue;

        auto value = node.value<int64_t>();
        if (!value) {
            return invalid(std::string{section_name} + "." + std::string{key}
                           + " must be an integer");
        }
        if (*value < 1 || *value > int64_t{std::numeric_limits<uint32_t>::max()}) {
            return invalid(std::string{section_name} + "." + std::string{key}
                           + " out of range: " + std::to_string(*value));
        }
        *field = static_cast<uint32_t>(*value);
    }
    return {};
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [cluster]
        if (auto cluster = tbl["cluster"]; cluster.is_table()) {
            if (auto r = read_counts(cluster, "cluster", {
                    {"max_nodes", &config.cluster.max_nodes},
                    {"min_nodes", &config.cluster.min_nodes},
                    {"max_pending_placements", &config.cluster.max_pending_placements}});
                !r) {
                return r.error();
            }
            config.cluster.auto_drain = cluster["auto_drain"].value_or(true);
        }

        // [heartbeat]
        if (auto heartbeat = tbl["heartbeat"]; heartbeat.is_table()) {
            if (auto r = read_counts(heartbeat, "heartbeat", {
                    {"interval_ms", &config.heartbeat.interval_ms},
                    {"node_timeout_ms", &config.heartbeat.node_timeout_ms},
                    {"drain_timeout_ms", &config.heartbeat.drain_timeout_ms}});
                !r) {
                return r.error();
            }
        }

        // [optimizer]
        if (auto optimizer = tbl["optimizer"]; optimizer.is_table()) {
            if (auto r = read_counts(optimizer, "optimizer", {
                    {"interval_ms", &config.optimizer.interval_ms},
                    {"metrics_history_size", &config.optimizer.metrics_history_size}});
                !r) {
                return r.error();
            }

            // [optimizer.thresholds]
            if (auto th = optimizer["thresholds"]; th.is_table()) {
                auto& t = config.optimizer.thresholds;
                t.cpu_high = static_cast<float>(th["cpu_high"].value_or(80.0));
                t.cpu_low = static_cast<float>(th["cpu_low"].value_or(20.0));
                t.memory_high = static_cast<float>(th["memory_high"].value_or(85.0));
                t.memory_low = static_cast<float>(th["memory_low"].value_or(30.0));
                t.disk_high = static_cast<float>(th["disk_high"].value_or(90.0));
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            if (auto r = read_counts(telemetry, "telemetry", {
                    {"max_file_size_mb", &config.telemetry.max_file_size_mb},
                    {"rotate_count", &config.telemetry.rotate_count}});
                !r) {
                return r.error();
            }
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigurationInvalid,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<void> validate_thresholds(const ResourceThresholds& t) {
    if (!is_percent(t.cpu_high) || !is_percent(t.cpu_low) ||
        !is_percent(t.memory_high) || !is_percent(t.memory_low) ||
        !is_percent(t.disk_high)) {
        return invalid("thresholds must lie in [0, 100]");
    }
    if (t.cpu_low >= t.cpu_high) {
        return invalid("cpu_low must be below cpu_high");
    }
    if (t.memory_low >= t.memory_high) {
        return invalid("memory_low must be below memory_high");
    }
    return {};
}

Result<void> validate_config(const Config& config) {
    const auto& c = config.cluster;
    if (c.max_nodes == 0) return invalid("max_nodes must be positive");
    if (c.min_nodes == 0) return invalid("min_nodes must be positive");
    if (c.max_pending_placements == 0) return invalid("max_pending_placements must be positive");
    if (c.min_nodes > c.max_nodes) {
        return invalid("min_nodes (" + std::to_string(c.min_nodes)
                       + ") exceeds max_nodes (" + std::to_string(c.max_nodes) + ")");
    }

    const auto& hb = config.heartbeat;
    if (hb.interval_ms == 0) return invalid("heartbeat interval_ms must be positive");
    if (hb.node_timeout_ms == 0) return invalid("node_timeout_ms must be positive");
    if (hb.drain_timeout_ms == 0) return invalid("drain_timeout_ms must be positive");
    if (hb.node_timeout_ms < hb.interval_ms) {
        return invalid("node_timeout_ms must not be shorter than the heartbeat interval");
    }

    const auto& opt = config.optimizer;
    if (opt.interval_ms == 0) return invalid("optimizer interval_ms must be positive");
    if (opt.metrics_history_size == 0) return invalid("metrics_history_size must be positive");
    if (auto th = validate_thresholds(opt.thresholds); !th) return th;

    if (!parse_log_level(config.telemetry.log_level)) {
        return invalid("unknown log_level: " + config.telemetry.log_level);
    }
    return {};
}

}  // namespace fleet_coordinator
