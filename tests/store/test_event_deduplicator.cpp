// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for EventDeduplicator
 */

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "store/event_deduplicator.hpp"

using namespace beacon;
using namespace beacon::store;

TEST(EventDeduplicatorTest, MarksEachIdOnce) {
    EventDeduplicator dedup;
    EXPECT_TRUE(dedup.tryMark("evt-1"));
    EXPECT_FALSE(dedup.tryMark("evt-1"));
    EXPECT_TRUE(dedup.tryMark("evt-2"));
    EXPECT_TRUE(dedup.contains("evt-1"));
    EXPECT_EQ(dedup.size(), 2u);
}

TEST(EventDeduplicatorTest, ForgetAllowsRetry) {
    EventDeduplicator dedup;
    ASSERT_TRUE(dedup.tryMark("evt-1"));
    dedup.forget("evt-1");
    EXPECT_FALSE(dedup.contains("evt-1"));
    EXPECT_TRUE(dedup.tryMark("evt-1"));
}

TEST(EventDeduplicatorTest, CapacityEvictsOldestIds) {
    config::DedupConfig cfg;
    cfg.capacity = 2;
    EventDeduplicator dedup(cfg);
    EXPECT_EQ(dedup.capacity(), 2u);

    dedup.tryMark("a");
    dedup.tryMark("b");
    dedup.tryMark("c");
    EXPECT_LE(dedup.size(), 2u);
    EXPECT_TRUE(dedup.contains("c"));
    EXPECT_FALSE(dedup.contains("a"));
}

TEST(EventDeduplicatorTest, ConcurrentMarksAdmitExactlyOne) {
    EventDeduplicator dedup;
    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < 100; ++j) {
                if (dedup.tryMark("evt-" + std::to_string(j))) {
                    admitted.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(admitted.load(), 100);
}
