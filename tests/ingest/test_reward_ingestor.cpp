// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for RewardIngestor
 */

#include <gtest/gtest.h>

#include "catalog/catalog_cache.hpp"
#include "ingest/reward_ingestor.hpp"
#include "store/memory_arm_stats_store.hpp"
#include "test_helpers.hpp"

using namespace beacon;
using namespace beacon::ingest;
using beacon::test::kNow;
using beacon::test::makeEvent;
using beacon::test::makeProduct;
using model::Action;

class RewardIngestorTest : public ::testing::Test {
protected:
    void SetUp() override {
        arms_ = std::make_unique<store::MemoryArmStatsStore>();
        profiles_ = std::make_unique<profile::UserProfileStore>(3, 0.2);
        catalog_.refresh({makeProduct("p1", "books"), makeProduct("p2", "games")},
                         kNow);
        ingestor_ = std::make_unique<RewardIngestor>(*arms_, *profiles_,
                                                     catalog_, IngestPolicy{});
    }

    void TearDown() override {
        ingestor_.reset();
        profiles_.reset();
        arms_.reset();
    }

    auto rejectionReason(const model::InteractionEvent& event)
        -> ValidationReason {
        try {
            ingestor_->ingest(event, kNow);
        } catch (const ValidationError& e) {
            return e.reason();
        }
        ADD_FAILURE() << "event was accepted";
        return ValidationReason::InvalidValue;
    }

    std::unique_ptr<store::MemoryArmStatsStore> arms_;
    std::unique_ptr<profile::UserProfileStore> profiles_;
    catalog::CatalogCache catalog_;
    std::unique_ptr<RewardIngestor> ingestor_;
};

TEST_F(RewardIngestorTest, AppliesMappedReward) {
    auto receipt =
        ingestor_->ingest(makeEvent("e1", "u1", "p1", Action::Purchase), kNow);

    EXPECT_TRUE(receipt.accepted);
    EXPECT_FALSE(receipt.duplicate);
    EXPECT_DOUBLE_EQ(receipt.rewardApplied, 5.0);
    EXPECT_EQ(receipt.pulls, 1u);
    EXPECT_DOUBLE_EQ(arms_->find("u1", "p1")->meanReward, 5.0);

    auto profile = profiles_->find("u1");
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->totalInteractions, 1u);
    EXPECT_TRUE(profile->affinityFor("books").has_value());
}

TEST_F(RewardIngestorTest, DuplicateEventChangesNothing) {
    auto event = makeEvent("evt-1", "u1", "p1", Action::Purchase);
    ingestor_->ingest(event, kNow);
    auto replay = ingestor_->ingest(event, kNow);

    EXPECT_TRUE(replay.accepted);
    EXPECT_TRUE(replay.duplicate);
    EXPECT_DOUBLE_EQ(replay.rewardApplied, 0.0);
    EXPECT_EQ(arms_->find("u1", "p1")->pulls, 1u);
    EXPECT_EQ(profiles_->find("u1")->totalInteractions, 1u);

    auto j = replay.toJson();
    EXPECT_TRUE(j["duplicate"].get<bool>());
    EXPECT_EQ(j["event_id"], "evt-1");
}

TEST_F(RewardIngestorTest, RejectsMissingFields) {
    EXPECT_EQ(rejectionReason(makeEvent("", "u1", "p1", Action::View)),
              ValidationReason::MissingField);
    EXPECT_EQ(rejectionReason(makeEvent("e1", "", "p1", Action::View)),
              ValidationReason::MissingField);
    EXPECT_EQ(rejectionReason(makeEvent("e1", "u1", "", Action::View)),
              ValidationReason::MissingField);
    EXPECT_EQ(arms_->armCount(), 0u);
}

TEST_F(RewardIngestorTest, RejectsBadTimestamps) {
    EXPECT_EQ(rejectionReason(makeEvent("e1", "u1", "p1", Action::View,
                                        model::Timestamp{})),
              ValidationReason::InvalidTimestamp);
    EXPECT_EQ(rejectionReason(makeEvent("e2", "u1", "p1", Action::View,
                                        kNow + std::chrono::minutes(10))),
              ValidationReason::InvalidTimestamp);

    auto withinSkew = makeEvent("e3", "u1", "p1", Action::View,
                                kNow + std::chrono::minutes(4));
    EXPECT_TRUE(ingestor_->ingest(withinSkew, kNow).accepted);
}

TEST_F(RewardIngestorTest, UnknownActionPolicy) {
    auto event = makeEvent("e1", "u1", "p1", Action::Unknown);
    event.actionName = "wishlist";
    EXPECT_EQ(rejectionReason(event), ValidationReason::UnknownAction);

    IngestPolicy lenient;
    lenient.rejectUnknownActions = false;
    RewardIngestor legacy(*arms_, *profiles_, catalog_, lenient);
    auto receipt = legacy.ingest(event, kNow);
    EXPECT_TRUE(receipt.accepted);
    EXPECT_DOUBLE_EQ(receipt.rewardApplied, 0.0);
    EXPECT_EQ(arms_->find("u1", "p1")->pulls, 1u);
}

TEST_F(RewardIngestorTest, ProductOutsideCatalogLeavesAffinityAlone) {
    ingestor_->ingest(makeEvent("e1", "u1", "p404", Action::Tick), kNow);
    auto profile = profiles_->find("u1");
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->totalInteractions, 1u);
    EXPECT_TRUE(profile->categoryAffinity.empty());
    EXPECT_TRUE(profile->brandAffinity.empty());
}

TEST_F(RewardIngestorTest, CatalogProductMovesEveryPreference) {
    // Purchase is worth 5, alpha 0.2
    ingestor_->ingest(makeEvent("e1", "u1", "p1", Action::Purchase), kNow);
    auto profile = profiles_->find("u1");
    ASSERT_TRUE(profile.has_value());
    EXPECT_DOUBLE_EQ(*profile->affinityFor("books"), 1.0);
    EXPECT_DOUBLE_EQ(*profile->brandAffinityFor("acme"), 1.0);
    EXPECT_DOUBLE_EQ(*profile->priceBandAffinityFor(model::PriceBand::Budget),
                     1.0);
}

TEST_F(RewardIngestorTest, BatchReportsEachOutcome) {
    std::vector<model::InteractionEvent> batch = {
        makeEvent("e1", "u1", "p1", Action::Tick),
        makeEvent("e1", "u1", "p1", Action::Tick),
        makeEvent("e2", "", "p1", Action::Tick),
        makeEvent("e3", "u1", "p2", Action::Cross)};

    auto report = ingestor_->ingestBatch(batch, kNow);
    EXPECT_EQ(report.total, 4u);
    EXPECT_EQ(report.accepted, 2u);
    EXPECT_EQ(report.duplicates, 1u);
    ASSERT_EQ(report.rejected.size(), 1u);
    EXPECT_EQ(report.rejected.front().index, 2u);
    EXPECT_EQ(report.rejected.front().reason, ValidationReason::MissingField);

    auto j = report.toJson();
    EXPECT_EQ(j["rejected_count"], 1);
    EXPECT_EQ(j["rejected"][0]["reason"], "missing_field");

    auto stats = ingestor_->stats();
    EXPECT_EQ(stats["accepted"], 2);
    EXPECT_EQ(stats["duplicates"], 1);
    EXPECT_EQ(stats["rejected"], 1);
}

TEST_F(RewardIngestorTest, RewardsFollowConfiguredTable) {
    IngestPolicy policy;
    policy.rewards.view = 0.5;
    RewardIngestor custom(*arms_, *profiles_, catalog_, policy);
    EXPECT_DOUBLE_EQ(custom.rewardFor(Action::View), 0.5);
    EXPECT_DOUBLE_EQ(
        custom.ingest(makeEvent("e1", "u1", "p1", Action::View), kNow)
            .rewardApplied,
        0.5);
}
