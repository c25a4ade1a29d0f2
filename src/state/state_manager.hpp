/**
 * @file state_manager.hpp
 * @brief Versioned per-node state blobs with periodic reconciliation.
 *
 * Best-effort eventual convergence: writes are ordered per node by version
 * (last writer wins), and consistency_check() detects what has drifted.
 * There is no agreement protocol; divergence is reported and self-heals on
 * the next check.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "registry/node_registry.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_coordinator {

/**
 * @brief The state blob a node has published.
 */
struct ClusterState {
    NodeId node_id;
    std::string resource_key;       ///< Logical resource this state describes; may be empty
    Payload payload;
    uint64_t version{0};
    Timestamp written_at{};         ///< Wall clock, breaks version ties in conflicts
    uint64_t fingerprint{0};        ///< FNV-1a of payload
};

struct DivergenceReport {
    enum class Kind : uint8_t {
        Orphaned,   ///< Owning node absent from the registry; entry collected
        Conflict    ///< Several nodes disagree about one resource_key
    } kind;

    NodeId node_id;                 ///< Orphan owner, or the conflict winner
    std::string resource_key;
    std::vector<NodeId> involved;   ///< Conflict participants, winner first
    uint64_t winning_version{0};
    std::string detail;
};

[[nodiscard]] constexpr std::string_view to_string(DivergenceReport::Kind kind) noexcept {
    switch (kind) {
        case DivergenceReport::Kind::Orphaned: return "orphaned";
        case DivergenceReport::Kind::Conflict: return "conflict";
    }
    return "unknown";
}

class StateManager {
public:
    explicit StateManager(const NodeRegistry& registry);

    /**
     * @brief Store @p payload for @p node_id at @p version.
     *
     * @p written_at carries the origin time of a relayed write; local
     * writes leave it empty and are stamped now.
     *
     * @return UnknownNode if the registry has no live record for the node,
     *         StaleVersion if version <= the stored version.
     */
    Result<void> push_state(const NodeId& node_id,
                            Payload payload,
                            uint64_t version,
                            std::string resource_key = {},
                            std::optional<Timestamp> written_at = std::nullopt);

    /// Current state, or nullopt if none or if its owner was lost.
    [[nodiscard]] std::optional<ClusterState> pull_state(const NodeId& node_id) const;

    /// True when @p payload matches the stored fingerprint for @p node_id.
    [[nodiscard]] bool verify_state(const NodeId& node_id, const Payload& payload) const;

    /// Owner evicted: hide the entry until the next check collects it.
    void on_node_lost(const NodeId& node_id);

    /**
     * @brief Compare stored state against the live registry.
     *
     * Orphaned entries are reported and removed. Entries sharing a
     * resource_key with differing versions, or equal versions but different
     * payloads, are reported as one Conflict naming the winner.
     */
    std::vector<DivergenceReport> consistency_check();

    /// Winning state for @p resource_key among live entries.
    [[nodiscard]] std::optional<ClusterState> resolve(const std::string& resource_key) const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] uint64_t stale_writes() const noexcept { return stale_writes_.load(); }

    [[nodiscard]] static uint64_t fingerprint(const Payload& payload) noexcept;

private:
    struct Entry {
        ClusterState state;
        bool orphaned = false;
    };

    const NodeRegistry& registry_;

    mutable std::mutex mutex_;
    std::map<NodeId, Entry> entries_;
    std::atomic<uint64_t> stale_writes_{0};
};

}  // namespace fleet_coordinator
