// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for UcbSelector and candidate ranking
 */

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "bandit/ranking.hpp"
#include "bandit/ucb_selector.hpp"
#include "test_helpers.hpp"

using namespace beacon;
using namespace beacon::bandit;
using beacon::test::makeProduct;

namespace {

auto makeArm(const std::string& productId, uint64_t pulls, double mean)
    -> model::ArmStat {
    model::ArmStat stat;
    stat.userId = "u1";
    stat.productId = productId;
    stat.pulls = pulls;
    stat.meanReward = mean;
    stat.cumulativeReward = mean * static_cast<double>(pulls);
    return stat;
}

}  // namespace

class UcbSelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        products_ = {makeProduct("p1"), makeProduct("p2"), makeProduct("p3")};
        for (const auto& product : products_) {
            pool_.push_back(&product);
        }
    }

    void addArm(const model::ArmStat& stat) {
        arms_.arms[stat.productId] = stat;
        arms_.totalPulls += stat.pulls;
    }

    UcbSelector selector_{std::sqrt(2.0)};
    std::vector<model::Product> products_;
    std::vector<const model::Product*> pool_;
    model::UserArmSnapshot arms_;
};

TEST_F(UcbSelectorTest, UntriedArmsScoreInfinity) {
    EXPECT_TRUE(std::isinf(selector_.score(nullptr, 10)));
    auto untried = makeArm("p1", 0, 0.0);
    EXPECT_TRUE(std::isinf(selector_.score(&untried, 10)));
}

TEST_F(UcbSelectorTest, ScoreIsMeanPlusConfidenceBonus) {
    auto arm = makeArm("p1", 2, 1.0);
    double expected = 1.0 + std::sqrt(2.0) * std::sqrt(std::log(4.0) / 3.0);
    EXPECT_NEAR(selector_.score(&arm, 3), expected, 1e-12);

    UcbSelector greedy(0.0);
    EXPECT_DOUBLE_EQ(greedy.score(&arm, 3), 1.0);
    EXPECT_DOUBLE_EQ(greedy.explorationCoefficient(), 0.0);
}

TEST_F(UcbSelectorTest, BonusShrinksWithMorePulls) {
    auto few = makeArm("p1", 2, 1.0);
    auto many = makeArm("p2", 200, 1.0);
    EXPECT_GT(selector_.score(&few, 202), selector_.score(&many, 202));
}

TEST_F(UcbSelectorTest, UntriedFirstThenByUpperBound) {
    // p1: two ticks, p2: one cross, p3 never shown
    addArm(makeArm("p1", 2, 1.0));
    addArm(makeArm("p2", 1, -1.0));

    auto items = selector_.select(pool_, arms_, 3);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].productId, "p3");
    EXPECT_TRUE(items[0].isUntried());
    EXPECT_EQ(items[1].productId, "p1");
    EXPECT_NEAR(items[1].score, 1.96, 0.01);
    EXPECT_EQ(items[2].productId, "p2");
    EXPECT_NEAR(items[2].score, 0.18, 0.01);
    EXPECT_EQ(items[0].rank, 1);
    EXPECT_EQ(items[2].rank, 3);
}

TEST_F(UcbSelectorTest, EveryArmIsEventuallyExplored) {
    addArm(makeArm("p1", 50, 5.0));
    addArm(makeArm("p2", 50, 4.0));

    auto items = selector_.select(pool_, arms_, 1);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].productId, "p3");
}

TEST_F(UcbSelectorTest, SelectClampsToPoolSize) {
    EXPECT_EQ(selector_.select(pool_, arms_, 10).size(), 3u);
    EXPECT_TRUE(selector_.select({}, arms_, 5).empty());
}

TEST(RankingTest, TiesBreakByPopularityThenId) {
    auto a = makeProduct("b", "general", 5);
    auto b = makeProduct("a", "general", 5);
    auto c = makeProduct("c", "general", 9);
    std::vector<ScoredCandidate> candidates = {
        {&a, 1.0}, {&b, 1.0}, {&c, 1.0}};

    auto items = takeTopK(candidates, 3);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].productId, "c");
    EXPECT_EQ(items[1].productId, "a");
    EXPECT_EQ(items[2].productId, "b");
}

TEST(RankingTest, ResultIsDistinctAndRanked) {
    auto a = makeProduct("a");
    auto b = makeProduct("b");
    std::vector<ScoredCandidate> candidates = {
        {&a, 0.5},
        {&b, std::numeric_limits<double>::infinity()},
        {&a, 0.7}};

    auto items = takeTopK(candidates, 5);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].productId, "b");
    EXPECT_EQ(items[1].productId, "a");
    EXPECT_EQ(items[1].rank, 2);
}
