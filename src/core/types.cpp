/**
 * @file types.cpp
 * @brief Helpers for the shared vocabulary types.
 */

#include "core/types.hpp"

#include <algorithm>

namespace fleet_coordinator {

bool satisfies(const CapabilitySet& offered, const CapabilitySet& required) {
    // Both sets are ordered, so a linear merge check suffices
    return std::includes(offered.begin(), offered.end(),
                         required.begin(), required.end());
}

std::string join_capabilities(const CapabilitySet& caps) {
    std::string out;
    for (const auto& cap : caps) {
        if (!out.empty()) out += ',';
        out += cap;
    }
    return out;
}

std::optional<NodeStatus> parse_node_status(std::string_view text) noexcept {
    if (text == "active")   return NodeStatus::Active;
    if (text == "draining") return NodeStatus::Draining;
    if (text == "dead")     return NodeStatus::Dead;
    return std::nullopt;
}

}  // namespace fleet_coordinator
