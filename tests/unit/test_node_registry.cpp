/**
 * @file test_node_registry.cpp
 * @brief Unit tests for NodeRegistry.
 */

#include "registry/node_registry.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <limits>
#include <set>
#include <thread>
#include <vector>

using namespace fleet_coordinator;

namespace {

NodeAddress addr(uint16_t port) {
    return NodeAddress{"10.0.0.1", port};
}

}  // namespace

TEST(NodeRegistryTest, EmptyByDefault) {
    NodeRegistry registry(8);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.capacity(), 8u);
    EXPECT_TRUE(registry.snapshot_all().empty());
    EXPECT_FALSE(registry.get("node-00000001").has_value());
}

TEST(NodeRegistryTest, RegisterCreatesActiveRecord) {
    NodeRegistry registry(8);
    auto before = std::chrono::steady_clock::now();
    auto id = registry.register_node(addr(7000), {"cpu", "gpu"});
    ASSERT_TRUE(id.has_value());

    auto record = registry.get(*id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->id, *id);
    EXPECT_EQ(record->status, NodeStatus::Active);
    EXPECT_DOUBLE_EQ(record->load, 0.0);
    EXPECT_EQ(record->capabilities, (CapabilitySet{"cpu", "gpu"}));
    EXPECT_EQ(record->address, addr(7000));
    EXPECT_GE(record->last_heartbeat, before);
    EXPECT_FALSE(record->drain_started.has_value());
}

TEST(NodeRegistryTest, IdsAreUnique) {
    NodeRegistry registry(64);
    std::set<NodeId> ids;
    for (uint16_t i = 0; i < 32; ++i) {
        auto id = registry.register_node(addr(i), {});
        ASSERT_TRUE(id);
        ids.insert(*id);
    }
    EXPECT_EQ(ids.size(), 32u);
}

TEST(NodeRegistryTest, GeneratedIdsAreZeroPadded) {
    NodeRegistry registry(8);
    auto first = registry.register_node(addr(1), {});
    auto second = registry.register_node(addr(2), {});
    ASSERT_TRUE(first && second);
    EXPECT_EQ(*first, "node-00000001");
    EXPECT_EQ(*second, "node-00000002");
}

TEST(NodeRegistryTest, GeneratedIdSkipsCallerChosenId) {
    NodeRegistry registry(8);
    ASSERT_TRUE(registry.register_node_with_id("node-00000001", addr(1), {}));

    auto id = registry.register_node(addr(2), {});
    ASSERT_TRUE(id);
    EXPECT_NE(*id, "node-00000001");
    EXPECT_EQ(registry.size(), 2u);
}

TEST(NodeRegistryTest, CapacityExceeded) {
    NodeRegistry registry(2);
    ASSERT_TRUE(registry.register_node(addr(1), {}));
    ASSERT_TRUE(registry.register_node(addr(2), {}));

    auto third = registry.register_node(addr(3), {});
    ASSERT_FALSE(third);
    EXPECT_TRUE(third.error().is(ErrorCode::CapacityExceeded));
    EXPECT_EQ(registry.size(), 2u);
}

TEST(NodeRegistryTest, ReRegisterAtCapacityReplacesRecord) {
    NodeRegistry registry(1);
    ASSERT_TRUE(registry.register_node_with_id("edge-a", addr(1), {"cpu"}));
    ASSERT_TRUE(registry.update_status("edge-a", 40.0, NodeStatus::Active));

    auto again = registry.register_node_with_id("edge-a", addr(2), {"gpu"});
    ASSERT_TRUE(again);

    auto record = registry.get("edge-a");
    ASSERT_TRUE(record);
    EXPECT_DOUBLE_EQ(record->load, 0.0);
    EXPECT_EQ(record->address, addr(2));
    EXPECT_EQ(record->capabilities, (CapabilitySet{"gpu"}));
}

TEST(NodeRegistryTest, EmptyIdRejected) {
    NodeRegistry registry(4);
    auto result = registry.register_node_with_id("", addr(1), {});
    ASSERT_FALSE(result);
    EXPECT_TRUE(result.error().is(ErrorCode::InvalidArgument));
}

TEST(NodeRegistryTest, UnregisterIsIdempotent) {
    NodeRegistry registry(4);
    auto id = registry.register_node(addr(1), {});
    ASSERT_TRUE(id);

    auto removed = registry.unregister_node(*id);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->status, NodeStatus::Dead);
    EXPECT_FALSE(registry.contains(*id));

    EXPECT_FALSE(registry.unregister_node(*id).has_value());
    EXPECT_FALSE(registry.unregister_node("never-existed").has_value());
}

// ═══════════════════════════════════════════════
// Status updates
// ═══════════════════════════════════════════════

TEST(NodeRegistryTest, UpdateStatusStampsHeartbeat) {
    NodeRegistry registry(4);
    auto id = registry.register_node(addr(1), {});
    ASSERT_TRUE(id);
    auto registered = registry.get(*id)->last_heartbeat;

    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    ASSERT_TRUE(registry.update_status(*id, 55.5, NodeStatus::Active));

    auto record = registry.get(*id);
    EXPECT_DOUBLE_EQ(record->load, 55.5);
    EXPECT_GT(record->last_heartbeat, registered);
}

TEST(NodeRegistryTest, UpdateUnknownNodeIsNotFound) {
    NodeRegistry registry(4);
    auto result = registry.update_status("ghost", 1.0, NodeStatus::Active);
    ASSERT_FALSE(result);
    EXPECT_TRUE(result.error().is(ErrorCode::NotFound));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(NodeRegistryTest, InvalidLoadRejected) {
    NodeRegistry registry(4);
    auto id = registry.register_node(addr(1), {});
    ASSERT_TRUE(id);

    EXPECT_TRUE(registry.update_status(*id, -1.0, NodeStatus::Active)
                    .error().is(ErrorCode::InvalidArgument));
    EXPECT_TRUE(registry.update_status(*id, std::nan(""), NodeStatus::Active)
                    .error().is(ErrorCode::InvalidArgument));
    EXPECT_TRUE(registry.update_status(*id, std::numeric_limits<double>::infinity(),
                                       NodeStatus::Active)
                    .error().is(ErrorCode::InvalidArgument));
    EXPECT_DOUBLE_EQ(registry.get(*id)->load, 0.0);
}

TEST(NodeRegistryTest, DeadCannotBeReported) {
    NodeRegistry registry(4);
    auto id = registry.register_node(addr(1), {});
    ASSERT_TRUE(id);

    auto result = registry.update_status(*id, 0.0, NodeStatus::Dead);
    ASSERT_FALSE(result);
    EXPECT_TRUE(result.error().is(ErrorCode::InvalidArgument));
    EXPECT_EQ(registry.get(*id)->status, NodeStatus::Active);
}

TEST(NodeRegistryTest, DrainStartTrackedAcrossTransitions) {
    NodeRegistry registry(4);
    auto id = registry.register_node(addr(1), {});
    ASSERT_TRUE(id);

    ASSERT_TRUE(registry.update_status(*id, 10.0, NodeStatus::Draining));
    auto first = registry.get(*id)->drain_started;
    ASSERT_TRUE(first.has_value());

    // A second draining report keeps the original start
    ASSERT_TRUE(registry.update_status(*id, 5.0, NodeStatus::Draining));
    EXPECT_EQ(registry.get(*id)->drain_started, first);

    ASSERT_TRUE(registry.update_status(*id, 5.0, NodeStatus::Active));
    EXPECT_FALSE(registry.get(*id)->drain_started.has_value());
}

TEST(NodeRegistryTest, BeginDrainLeavesHeartbeatAlone) {
    NodeRegistry registry(4);
    auto id = registry.register_node(addr(1), {});
    ASSERT_TRUE(id);
    auto heartbeat = registry.get(*id)->last_heartbeat;

    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    ASSERT_TRUE(registry.begin_drain(*id));

    auto record = registry.get(*id);
    EXPECT_EQ(record->status, NodeStatus::Draining);
    EXPECT_TRUE(record->drain_started.has_value());
    EXPECT_EQ(record->last_heartbeat, heartbeat);

    EXPECT_TRUE(registry.begin_drain("ghost").error().is(ErrorCode::NotFound));
}

TEST(NodeRegistryTest, UpdateCapabilities) {
    NodeRegistry registry(4);
    auto id = registry.register_node(addr(1), {"cpu"});
    ASSERT_TRUE(id);

    ASSERT_TRUE(registry.update_capabilities(*id, {"cpu", "gpu"}));
    EXPECT_EQ(registry.get(*id)->capabilities, (CapabilitySet{"cpu", "gpu"}));
    EXPECT_FALSE(registry.update_capabilities("ghost", {}));
}

// ═══════════════════════════════════════════════
// Eviction primitives
// ═══════════════════════════════════════════════

TEST(NodeRegistryTest, EvictIfStaleRechecksHeartbeat) {
    NodeRegistry registry(4);
    auto id = registry.register_node(addr(1), {});
    ASSERT_TRUE(id);
    auto timeout = Millis{100};
    auto heartbeat = registry.get(*id)->last_heartbeat;

    // Not yet stale
    EXPECT_FALSE(registry.evict_if_stale(*id, heartbeat + timeout, timeout).has_value());
    EXPECT_TRUE(registry.contains(*id));

    auto removed = registry.evict_if_stale(*id, heartbeat + timeout + Millis{1}, timeout);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->status, NodeStatus::Dead);
    EXPECT_FALSE(registry.contains(*id));
}

TEST(NodeRegistryTest, EvictDrainingOnlyTouchesDrainingNodes) {
    NodeRegistry registry(4);
    auto id = registry.register_node(addr(1), {});
    ASSERT_TRUE(id);

    EXPECT_FALSE(registry.evict_draining(*id).has_value());
    ASSERT_TRUE(registry.begin_drain(*id));
    EXPECT_TRUE(registry.evict_draining(*id).has_value());
    EXPECT_EQ(registry.size(), 0u);
}

TEST(NodeRegistryTest, SnapshotIsSortedCopy) {
    NodeRegistry registry(8);
    ASSERT_TRUE(registry.register_node_with_id("c", addr(3), {}));
    ASSERT_TRUE(registry.register_node_with_id("a", addr(1), {}));
    ASSERT_TRUE(registry.register_node_with_id("b", addr(2), {}));

    auto snapshot = registry.snapshot_all();
    ASSERT_EQ(snapshot.size(), 3u);
    EXPECT_EQ(snapshot[0].id, "a");
    EXPECT_EQ(snapshot[1].id, "b");
    EXPECT_EQ(snapshot[2].id, "c");

    // Mutating the registry afterwards leaves the copy untouched
    ASSERT_TRUE(registry.update_status("a", 99.0, NodeStatus::Active));
    EXPECT_DOUBLE_EQ(snapshot[0].load, 0.0);
}

TEST(NodeRegistryTest, ConcurrentRegistrationAndUpdates) {
    NodeRegistry registry(1000);
    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&registry, t] {
            for (int i = 0; i < kPerThread; ++i) {
                auto id = registry.register_node(
                    NodeAddress{"10.1.0." + std::to_string(t), static_cast<uint16_t>(i)}, {"cpu"});
                if (id) {
                    (void)registry.update_status(*id, static_cast<double>(i), NodeStatus::Active);
                }
                (void)registry.snapshot_all();
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(registry.size(), static_cast<size_t>(kThreads * kPerThread));
}
