// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for MemoryArmStatsStore
 */

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "core/exception.hpp"
#include "store/memory_arm_stats_store.hpp"
#include "store/sqlite_arm_stats_store.hpp"
#include "test_helpers.hpp"

using namespace beacon;
using namespace beacon::store;
using beacon::test::kNow;

class MemoryArmStatsStoreTest : public ::testing::Test {
protected:
    void SetUp() override { store_ = std::make_unique<MemoryArmStatsStore>(); }

    void TearDown() override { store_.reset(); }

    std::unique_ptr<MemoryArmStatsStore> store_;
};

TEST_F(MemoryArmStatsStoreTest, GetOrCreateStartsUntried) {
    auto stat = store_->getOrCreate("u1", "p1");
    EXPECT_EQ(stat.userId, "u1");
    EXPECT_EQ(stat.productId, "p1");
    EXPECT_TRUE(stat.isUntried());
    EXPECT_EQ(store_->armCount(), 1u);
    EXPECT_EQ(store_->userCount(), 1u);
    EXPECT_EQ(store_->backendName(), "memory");
}

TEST_F(MemoryArmStatsStoreTest, FindDoesNotCreate) {
    EXPECT_FALSE(store_->find("u1", "p1").has_value());
    EXPECT_EQ(store_->armCount(), 0u);
}

TEST_F(MemoryArmStatsStoreTest, UpdateMaintainsRunningMean) {
    store_->update("u1", "p1", 1.0, "e1", kNow);
    store_->update("u1", "p1", 5.0, "e2", kNow);
    auto result = store_->update("u1", "p1", -1.0, "e3", kNow);

    EXPECT_TRUE(result.applied());
    EXPECT_EQ(result.stat.pulls, 3u);
    EXPECT_DOUBLE_EQ(result.stat.cumulativeReward, 5.0);
    EXPECT_NEAR(result.stat.meanReward, 5.0 / 3.0, 1e-12);
    EXPECT_EQ(result.stat.lastUpdated, kNow);
}

TEST_F(MemoryArmStatsStoreTest, DuplicateEventIsNoOp) {
    auto first = store_->update("u1", "p1", 5.0, "evt-1", kNow);
    auto second = store_->update("u1", "p1", 5.0, "evt-1", kNow);

    EXPECT_TRUE(first.applied());
    EXPECT_EQ(second.status, UpdateStatus::Duplicate);
    EXPECT_EQ(second.stat.pulls, 1u);
    EXPECT_DOUBLE_EQ(store_->find("u1", "p1")->cumulativeReward, 5.0);
}

TEST_F(MemoryArmStatsStoreTest, DuplicateIdOnOtherArmReportsThatArm) {
    store_->update("u1", "p1", 1.0, "evt-1", kNow);
    auto replay = store_->update("u1", "p2", 1.0, "evt-1", kNow);

    EXPECT_EQ(replay.status, UpdateStatus::Duplicate);
    EXPECT_EQ(replay.stat.productId, "p2");
    EXPECT_EQ(replay.stat.pulls, 0u);
    EXPECT_FALSE(store_->find("u1", "p2").has_value());
}

TEST_F(MemoryArmStatsStoreTest, EmptyEventIdIsNeverDeduplicated) {
    store_->update("u1", "p1", 1.0, "", kNow);
    store_->update("u1", "p1", 1.0, "", kNow);
    EXPECT_EQ(store_->find("u1", "p1")->pulls, 2u);
}

TEST_F(MemoryArmStatsStoreTest, SnapshotCopiesUserArms) {
    store_->update("u1", "p1", 1.0, "e1", kNow);
    store_->update("u1", "p1", 1.0, "e2", kNow);
    store_->update("u1", "p2", 2.0, "e3", kNow);
    store_->update("u2", "p1", 2.0, "e4", kNow);

    auto snap = store_->snapshot("u1");
    EXPECT_EQ(snap.arms.size(), 2u);
    EXPECT_EQ(snap.totalPulls, 3u);
    ASSERT_NE(snap.find("p1"), nullptr);
    EXPECT_EQ(snap.find("p1")->pulls, 2u);
    EXPECT_EQ(snap.find("p9"), nullptr);

    store_->update("u1", "p1", 1.0, "e5", kNow);
    EXPECT_EQ(snap.find("p1")->pulls, 2u);

    EXPECT_TRUE(store_->snapshot("nobody").arms.empty());
    EXPECT_EQ(store_->userCount(), 2u);
}

TEST_F(MemoryArmStatsStoreTest, ConcurrentUpdatesLoseNothing) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 250;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < kPerThread; ++i) {
                auto eventId = "t" + std::to_string(t) + "-" + std::to_string(i);
                store_->update("u1", "p" + std::to_string(i % 4), 1.0, eventId,
                               kNow);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto snap = store_->snapshot("u1");
    EXPECT_EQ(snap.totalPulls,
              static_cast<uint64_t>(kThreads * kPerThread));
    for (const auto& [productId, stat] : snap.arms) {
        EXPECT_DOUBLE_EQ(stat.meanReward, 1.0);
        EXPECT_DOUBLE_EQ(stat.cumulativeReward,
                         static_cast<double>(stat.pulls));
    }
}

TEST_F(MemoryArmStatsStoreTest, ConcurrentReplaysApplyOnce) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < 50; ++i) {
                store_->update("u1", "p1", 2.0, "evt-" + std::to_string(i),
                               kNow);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(store_->find("u1", "p1")->pulls, 50u);
}

namespace {
template <typename Store>
concept Erasable = requires(Store& store) { store.clear(); };
}  // namespace

TEST(ArmStatsStoreContractTest, StatsCannotBeErased) {
    static_assert(!Erasable<IArmStatsStore>);
    static_assert(!Erasable<MemoryArmStatsStore>);
    static_assert(!Erasable<SqliteArmStatsStore>);
}

TEST_F(MemoryArmStatsStoreTest, ArmsOutliveReadersDuringUpdates) {
    store_->update("u1", "p1", 1.0, "seed", kNow);
    std::atomic<bool> done{false};
    std::thread reader([this, &done] {
        while (!done.load()) {
            auto snap = store_->snapshot("u1");
            ASSERT_GE(snap.totalPulls, 1u);
        }
    });
    for (int i = 0; i < 200; ++i) {
        store_->update("u1", "p" + std::to_string(i % 7), 1.0,
                       "evt-" + std::to_string(i), kNow);
    }
    done.store(true);
    reader.join();
    EXPECT_EQ(store_->snapshot("u1").totalPulls, 201u);
    EXPECT_EQ(store_->armCount(), 7u);
}

TEST(ArmStatsStoreFactoryTest, CreatesConfiguredBackend) {
    config::DedupConfig dedup;
    auto memory = createArmStatsStore({"memory", ""}, dedup);
    EXPECT_EQ(memory->backendName(), "memory");

    auto sqlite = createArmStatsStore({"sqlite", ":memory:"}, dedup);
    EXPECT_EQ(sqlite->backendName(), "sqlite");

    EXPECT_THROW((void)createArmStatsStore({"redis", ""}, dedup), ConfigError);
}
