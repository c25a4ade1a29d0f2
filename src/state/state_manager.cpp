/**
 * @file state_manager.cpp
 * @brief StateManager implementation.
 */

#include "state/state_manager.hpp"

#include <algorithm>
#include <chrono>

namespace fleet_coordinator {

namespace {

constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

/// Conflict order: higher version, then later write, then smaller node id.
bool wins_over(const ClusterState& a, const ClusterState& b) {
    if (a.version != b.version) return a.version > b.version;
    if (a.written_at != b.written_at) return a.written_at > b.written_at;
    return a.node_id < b.node_id;
}

}  // anonymous namespace

StateManager::StateManager(const NodeRegistry& registry)
    : registry_(registry) {}

uint64_t StateManager::fingerprint(const Payload& payload) noexcept {
    uint64_t hash = FNV_OFFSET;
    for (uint8_t byte : payload) {
        hash ^= byte;
        hash *= FNV_PRIME;
    }
    return hash;
}

// ─────────────────────────────────────────────
// Push / Pull
// ─────────────────────────────────────────────

Result<void> StateManager::push_state(const NodeId& node_id,
                                      Payload payload,
                                      uint64_t version,
                                      std::string resource_key,
                                      std::optional<Timestamp> written_at) {
    ClusterState state{
        .node_id = node_id,
        .resource_key = std::move(resource_key),
        .payload = std::move(payload),
        .version = version,
        .written_at = written_at.value_or(std::chrono::system_clock::now()),
        .fingerprint = 0
    };
    state.fingerprint = fingerprint(state.payload);

    // Liveness is checked under mutex_ so a concurrent removal followed by
    // on_node_lost() either precedes this check or orphans the stored entry.
    // Lock order: state, then registry (as in consistency_check).
    std::lock_guard lock(mutex_);
    auto record = registry_.get(node_id);
    if (!record || !record->is_live()) {
        return Error{ErrorCode::UnknownNode, "no live node " + node_id + " for state push"};
    }

    auto it = entries_.find(node_id);
    if (it != entries_.end() && !it->second.orphaned
        && version <= it->second.state.version) {
        stale_writes_.fetch_add(1);
        return Error{ErrorCode::StaleVersion,
                     "version " + std::to_string(version) + " <= stored "
                     + std::to_string(it->second.state.version) + " for " + node_id};
    }

    // An orphaned entry belonged to a previous incarnation of this id
    entries_.insert_or_assign(node_id, Entry{std::move(state), false});
    return {};
}

std::optional<ClusterState> StateManager::pull_state(const NodeId& node_id) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(node_id);
    if (it == entries_.end() || it->second.orphaned) return std::nullopt;
    return it->second.state;
}

bool StateManager::verify_state(const NodeId& node_id, const Payload& payload) const {
    auto digest = fingerprint(payload);
    std::lock_guard lock(mutex_);
    auto it = entries_.find(node_id);
    if (it == entries_.end() || it->second.orphaned) return false;
    return it->second.state.fingerprint == digest
        && it->second.state.payload == payload;
}

void StateManager::on_node_lost(const NodeId& node_id) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(node_id);
    if (it != entries_.end()) {
        it->second.orphaned = true;
    }
}

// ─────────────────────────────────────────────
// Reconciliation
// ─────────────────────────────────────────────

std::vector<DivergenceReport> StateManager::consistency_check() {
    std::vector<DivergenceReport> reports;

    std::lock_guard lock(mutex_);

    // Pass 1: collect orphans
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        const auto& id = it->first;
        if (it->second.orphaned || !registry_.contains(id)) {
            DivergenceReport report{
                .kind = DivergenceReport::Kind::Orphaned,
                .node_id = id,
                .resource_key = it->second.state.resource_key,
                .involved = {id},
                .winning_version = it->second.state.version,
                .detail = "owner no longer registered"
            };
            reports.push_back(std::move(report));
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    // Pass 2: group survivors by logical resource
    std::map<std::string, std::vector<const ClusterState*>> by_resource;
    for (const auto& [id, entry] : entries_) {
        if (entry.state.resource_key.empty()) continue;
        by_resource[entry.state.resource_key].push_back(&entry.state);
    }

    for (auto& [key, states] : by_resource) {
        if (states.size() < 2) continue;

        std::sort(states.begin(), states.end(),
                  [](const ClusterState* a, const ClusterState* b) { return wins_over(*a, *b); });
        const ClusterState* winner = states.front();

        bool diverged = std::any_of(states.begin() + 1, states.end(),
            [winner](const ClusterState* s) {
                return s->version != winner->version
                    || s->fingerprint != winner->fingerprint;
            });
        if (!diverged) continue;

        DivergenceReport report{
            .kind = DivergenceReport::Kind::Conflict,
            .node_id = winner->node_id,
            .resource_key = key,
            .involved = {},
            .winning_version = winner->version,
            .detail = std::to_string(states.size()) + " nodes disagree"
        };
        for (const auto* s : states) {
            report.involved.push_back(s->node_id);
        }
        reports.push_back(std::move(report));
    }

    return reports;
}

std::optional<ClusterState> StateManager::resolve(const std::string& resource_key) const {
    std::lock_guard lock(mutex_);
    const ClusterState* best = nullptr;
    for (const auto& [id, entry] : entries_) {
        if (entry.orphaned || entry.state.resource_key != resource_key) continue;
        if (best == nullptr || wins_over(entry.state, *best)) {
            best = &entry.state;
        }
    }
    if (best == nullptr) return std::nullopt;
    return *best;
}

size_t StateManager::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

}  // namespace fleet_coordinator
