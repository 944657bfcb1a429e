// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for SqliteArmStatsStore
 */

#include <gtest/gtest.h>

#include <filesystem>

#include "store/sqlite_arm_stats_store.hpp"
#include "test_helpers.hpp"

using namespace beacon;
using namespace beacon::store;
using beacon::test::kNow;

class SqliteArmStatsStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<SqliteArmStatsStore>(":memory:");
    }

    void TearDown() override { store_.reset(); }

    std::unique_ptr<SqliteArmStatsStore> store_;
};

TEST_F(SqliteArmStatsStoreTest, GetOrCreateInsertsUntriedArm) {
    auto stat = store_->getOrCreate("u1", "p1");
    EXPECT_TRUE(stat.isUntried());
    EXPECT_EQ(store_->armCount(), 1u);
    EXPECT_EQ(store_->getOrCreate("u1", "p1").pulls, 0u);
    EXPECT_EQ(store_->armCount(), 1u);
    EXPECT_EQ(store_->backendName(), "sqlite");
}

TEST_F(SqliteArmStatsStoreTest, UpsertMaintainsRunningMean) {
    auto first = store_->update("u1", "p1", 1.0, "e1", kNow);
    EXPECT_EQ(first.stat.pulls, 1u);
    EXPECT_DOUBLE_EQ(first.stat.meanReward, 1.0);

    store_->update("u1", "p1", 5.0, "e2", kNow);
    auto third = store_->update("u1", "p1", -1.0, "e3", kNow);

    EXPECT_TRUE(third.applied());
    EXPECT_EQ(third.stat.pulls, 3u);
    EXPECT_DOUBLE_EQ(third.stat.cumulativeReward, 5.0);
    EXPECT_NEAR(third.stat.meanReward, 5.0 / 3.0, 1e-12);
    EXPECT_EQ(third.stat.lastUpdated, kNow);
}

TEST_F(SqliteArmStatsStoreTest, UpdateAfterGetOrCreate) {
    store_->getOrCreate("u1", "p1");
    auto result = store_->update("u1", "p1", 2.0, "e1", kNow);
    EXPECT_EQ(result.stat.pulls, 1u);
    EXPECT_DOUBLE_EQ(result.stat.meanReward, 2.0);
}

TEST_F(SqliteArmStatsStoreTest, DuplicateEventIsNoOp) {
    store_->update("u1", "p1", 5.0, "evt-1", kNow);
    auto replay = store_->update("u1", "p1", 5.0, "evt-1", kNow);

    EXPECT_EQ(replay.status, UpdateStatus::Duplicate);
    EXPECT_EQ(replay.stat.pulls, 1u);
    EXPECT_EQ(store_->processedEventCount(), 1u);
}

TEST_F(SqliteArmStatsStoreTest, ProcessedEventsSurviveReopen) {
    auto path = std::filesystem::temp_directory_path() /
                "beacon_sqlite_store_test.db";
    std::filesystem::remove(path);
    {
        SqliteArmStatsStore store(path.string());
        store.update("u1", "p1", 5.0, "evt-1", kNow);
    }
    {
        SqliteArmStatsStore store(path.string());
        auto replay = store.update("u1", "p1", 5.0, "evt-1", kNow);
        EXPECT_EQ(replay.status, UpdateStatus::Duplicate);
        EXPECT_EQ(store.find("u1", "p1")->pulls, 1u);
    }
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");
}

TEST_F(SqliteArmStatsStoreTest, SnapshotAndCounts) {
    store_->update("u1", "p1", 1.0, "e1", kNow);
    store_->update("u1", "p2", 3.0, "e2", kNow);
    store_->update("u2", "p1", 1.0, "e3", kNow);

    auto snap = store_->snapshot("u1");
    EXPECT_EQ(snap.arms.size(), 2u);
    EXPECT_EQ(snap.totalPulls, 2u);
    EXPECT_DOUBLE_EQ(snap.find("p2")->meanReward, 3.0);
    EXPECT_EQ(store_->userCount(), 2u);
    EXPECT_EQ(store_->armCount(), 3u);
}

TEST_F(SqliteArmStatsStoreTest, PruneRemovesOldEventIds) {
    store_->update("u1", "p1", 1.0, "e1", kNow);
    store_->update("u1", "p1", 1.0, "e2", kNow);

    EXPECT_EQ(store_->pruneProcessedEvents(model::fromEpochMillis(0)), 0u);
    auto future = model::Clock::now() + std::chrono::hours(1);
    EXPECT_EQ(store_->pruneProcessedEvents(future), 2u);
    EXPECT_EQ(store_->processedEventCount(), 0u);
    EXPECT_EQ(store_->find("u1", "p1")->pulls, 2u);
}

TEST(SqliteArmStatsStorePruningTest, ExpiredEventIdsArePrunedDuringUpdates) {
    config::DedupConfig dedup;
    dedup.ttl = std::chrono::seconds(60);
    dedup.pruneEvery = 2;
    auto now = kNow;
    SqliteArmStatsStore store(":memory:", dedup, [&now] { return now; });

    store.update("u1", "p1", 1.0, "e1", now);
    EXPECT_EQ(store.processedEventCount(), 1u);

    now += std::chrono::seconds(120);
    store.update("u1", "p1", 1.0, "e2", now);

    EXPECT_EQ(store.processedEventCount(), 1u);
    EXPECT_EQ(store.find("u1", "p1")->pulls, 2u);

    now += std::chrono::seconds(30);
    store.update("u1", "p1", 1.0, "e3", now);
    EXPECT_EQ(store.processedEventCount(), 2u);
}

TEST(SqliteArmStatsStorePruningTest, ProcessedAtFollowsInjectedClock) {
    auto now = kNow;
    SqliteArmStatsStore store(":memory:", {}, [&now] { return now; });
    store.update("u1", "p1", 1.0, "e1", now);

    EXPECT_EQ(store.pruneProcessedEvents(kNow), 0u);
    EXPECT_EQ(store.pruneProcessedEvents(kNow + std::chrono::milliseconds(1)),
              1u);
}
