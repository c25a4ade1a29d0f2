/**
 * @file test_state_manager.cpp
 * @brief Unit tests for StateManager versioning and reconciliation.
 */

#include "state/state_manager.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string_view>
#include <thread>

using namespace fleet_coordinator;

class StateManagerTest : public ::testing::Test {
protected:
    NodeRegistry registry_{16};
    StateManager state_{registry_};

    void SetUp() override {
        for (const char* id : {"a", "b", "c"}) {
            ASSERT_TRUE(registry_.register_node_with_id(id, {"10.0.0.1", 7000}, {"cpu"}));
        }
    }

    static Payload bytes(std::string_view text) {
        return Payload(text.begin(), text.end());
    }
};

// ═══════════════════════════════════════════════
// Push / Pull
// ═══════════════════════════════════════════════

TEST_F(StateManagerTest, PushThenPull) {
    ASSERT_TRUE(state_.push_state("a", bytes("v1"), 1));

    auto pulled = state_.pull_state("a");
    ASSERT_TRUE(pulled.has_value());
    EXPECT_EQ(pulled->payload, bytes("v1"));
    EXPECT_EQ(pulled->version, 1u);
    EXPECT_EQ(pulled->fingerprint, StateManager::fingerprint(bytes("v1")));
}

TEST_F(StateManagerTest, EqualVersionIsStale) {
    ASSERT_TRUE(state_.push_state("a", bytes("first"), 5));

    auto second = state_.push_state("a", bytes("second"), 5);
    ASSERT_FALSE(second);
    EXPECT_TRUE(second.error().is(ErrorCode::StaleVersion));

    auto pulled = state_.pull_state("a");
    ASSERT_TRUE(pulled);
    EXPECT_EQ(pulled->payload, bytes("first"));
    EXPECT_EQ(pulled->version, 5u);
    EXPECT_EQ(state_.stale_writes(), 1u);
}

TEST_F(StateManagerTest, LowerVersionIsStaleHigherWins) {
    ASSERT_TRUE(state_.push_state("a", bytes("v5"), 5));
    EXPECT_FALSE(state_.push_state("a", bytes("v3"), 3));
    ASSERT_TRUE(state_.push_state("a", bytes("v9"), 9));

    auto pulled = state_.pull_state("a");
    ASSERT_TRUE(pulled);
    EXPECT_EQ(pulled->version, 9u);
    EXPECT_EQ(pulled->payload, bytes("v9"));
}

TEST_F(StateManagerTest, UnknownNodeRejected) {
    auto result = state_.push_state("ghost", bytes("x"), 1);
    ASSERT_FALSE(result);
    EXPECT_TRUE(result.error().is(ErrorCode::UnknownNode));
    EXPECT_EQ(state_.size(), 0u);
}

TEST_F(StateManagerTest, DrainingNodeMayStillPush) {
    ASSERT_TRUE(registry_.begin_drain("a"));
    EXPECT_TRUE(state_.push_state("a", bytes("final"), 1));
}

TEST_F(StateManagerTest, PullAbsent) {
    EXPECT_FALSE(state_.pull_state("a").has_value());
    EXPECT_FALSE(state_.pull_state("ghost").has_value());
}

TEST_F(StateManagerTest, VerifyState) {
    ASSERT_TRUE(state_.push_state("a", bytes("weights"), 1));
    EXPECT_TRUE(state_.verify_state("a", bytes("weights")));
    EXPECT_FALSE(state_.verify_state("a", bytes("weightz")));
    EXPECT_FALSE(state_.verify_state("b", bytes("weights")));
}

TEST_F(StateManagerTest, FingerprintIsFnv1a) {
    // FNV-1a 64-bit reference values
    EXPECT_EQ(StateManager::fingerprint({}), 14695981039346656037ULL);
    EXPECT_EQ(StateManager::fingerprint(bytes("a")), 0xaf63dc4c8601ec8cULL);
}

// ═══════════════════════════════════════════════
// Node loss
// ═══════════════════════════════════════════════

TEST_F(StateManagerTest, LostNodeStateHiddenThenCollected) {
    ASSERT_TRUE(state_.push_state("a", bytes("v1"), 1, "model/x"));
    registry_.unregister_node("a");
    state_.on_node_lost("a");

    EXPECT_FALSE(state_.pull_state("a").has_value());
    EXPECT_EQ(state_.size(), 1u);

    auto reports = state_.consistency_check();
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].kind, DivergenceReport::Kind::Orphaned);
    EXPECT_EQ(reports[0].node_id, "a");
    EXPECT_EQ(reports[0].resource_key, "model/x");
    EXPECT_EQ(state_.size(), 0u);

    EXPECT_TRUE(state_.consistency_check().empty());
}

TEST_F(StateManagerTest, EntryWithoutRegistryRecordIsOrphaned) {
    ASSERT_TRUE(state_.push_state("b", bytes("v1"), 1));
    registry_.unregister_node("b");   // no on_node_lost notification

    auto reports = state_.consistency_check();
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].kind, DivergenceReport::Kind::Orphaned);
    EXPECT_FALSE(state_.pull_state("b").has_value());
}

TEST_F(StateManagerTest, PushRacingUnregisterNeverRevivesState) {
    int revived = 0;
    for (int i = 0; i < 2000; ++i) {
        ASSERT_TRUE(registry_.register_node_with_id("n", {"10.0.0.9", 7000}, {"cpu"}));
        ASSERT_TRUE(state_.push_state("n", bytes("v10"), 10));

        std::atomic<bool> go{false};
        std::thread pusher([&] {
            while (!go.load()) {}
            auto older = state_.push_state("n", bytes("v3"), 3);
            EXPECT_FALSE(older);
            if (!older) {
                EXPECT_TRUE(older.error().is(ErrorCode::StaleVersion)
                            || older.error().is(ErrorCode::UnknownNode));
            }
            auto newer = state_.push_state("n", bytes("v11"), 11);
            if (!newer) {
                EXPECT_TRUE(newer.error().is(ErrorCode::UnknownNode));
            }
        });

        go.store(true);
        ASSERT_TRUE(registry_.unregister_node("n"));
        state_.on_node_lost("n");
        pusher.join();

        ASSERT_FALSE(registry_.contains("n"));
        if (state_.pull_state("n").has_value()) ++revived;
        state_.consistency_check();
    }
    EXPECT_EQ(revived, 0);
    EXPECT_FALSE(state_.pull_state("n").has_value());
}

TEST_F(StateManagerTest, ReRegisteredNodeStartsFreshHistory) {
    ASSERT_TRUE(state_.push_state("a", bytes("old"), 10));
    state_.on_node_lost("a");

    // Same id comes back and restarts its version counter
    ASSERT_TRUE(state_.push_state("a", bytes("new"), 1));
    auto pulled = state_.pull_state("a");
    ASSERT_TRUE(pulled);
    EXPECT_EQ(pulled->version, 1u);
    EXPECT_EQ(pulled->payload, bytes("new"));
}

// ═══════════════════════════════════════════════
// Conflicts
// ═══════════════════════════════════════════════

TEST_F(StateManagerTest, AgreeingNodesAreNotAConflict) {
    ASSERT_TRUE(state_.push_state("a", bytes("same"), 3, "cfg"));
    ASSERT_TRUE(state_.push_state("b", bytes("same"), 3, "cfg"));
    EXPECT_TRUE(state_.consistency_check().empty());
}

TEST_F(StateManagerTest, HigherVersionWinsConflict) {
    ASSERT_TRUE(state_.push_state("a", bytes("old"), 2, "cfg"));
    ASSERT_TRUE(state_.push_state("b", bytes("new"), 7, "cfg"));
    ASSERT_TRUE(state_.push_state("c", bytes("mid"), 4, "cfg"));

    auto reports = state_.consistency_check();
    ASSERT_EQ(reports.size(), 1u);
    const auto& r = reports[0];
    EXPECT_EQ(r.kind, DivergenceReport::Kind::Conflict);
    EXPECT_EQ(r.resource_key, "cfg");
    EXPECT_EQ(r.node_id, "b");
    EXPECT_EQ(r.winning_version, 7u);
    ASSERT_EQ(r.involved.size(), 3u);
    EXPECT_EQ(r.involved[0], "b");
    EXPECT_EQ(r.involved[1], "c");
    EXPECT_EQ(r.involved[2], "a");

    auto resolved = state_.resolve("cfg");
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->node_id, "b");
    EXPECT_EQ(resolved->payload, bytes("new"));
}

TEST_F(StateManagerTest, EqualVersionTieBrokenByWriteTime) {
    auto t0 = std::chrono::system_clock::now();
    ASSERT_TRUE(state_.push_state("a", bytes("early"), 4, "cfg", t0));
    ASSERT_TRUE(state_.push_state("b", bytes("late"), 4, "cfg", t0 + std::chrono::seconds(1)));

    auto reports = state_.consistency_check();
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].node_id, "b");
}

TEST_F(StateManagerTest, FullTieBrokenBySmallestId) {
    auto t0 = std::chrono::system_clock::now();
    ASSERT_TRUE(state_.push_state("c", bytes("x"), 4, "cfg", t0));
    ASSERT_TRUE(state_.push_state("b", bytes("y"), 4, "cfg", t0));

    auto resolved = state_.resolve("cfg");
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->node_id, "b");
}

TEST_F(StateManagerTest, UnkeyedEntriesNeverConflict) {
    ASSERT_TRUE(state_.push_state("a", bytes("x"), 1));
    ASSERT_TRUE(state_.push_state("b", bytes("y"), 9));
    EXPECT_TRUE(state_.consistency_check().empty());
}

TEST_F(StateManagerTest, ResolveIgnoresOrphans) {
    ASSERT_TRUE(state_.push_state("a", bytes("lost"), 9, "cfg"));
    ASSERT_TRUE(state_.push_state("b", bytes("kept"), 1, "cfg"));
    state_.on_node_lost("a");

    auto resolved = state_.resolve("cfg");
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->node_id, "b");
    EXPECT_FALSE(state_.resolve("unknown").has_value());
}
