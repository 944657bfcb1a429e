// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for recommendation results and queries
 */

#include <gtest/gtest.h>

#include <limits>

#include "model/recommendation.hpp"

using namespace beacon;
using namespace beacon::model;

TEST(RecommendationResultTest, UntriedArmsSerializeWithNullScore) {
    RecommendationResult result;
    result.userId = "u1";
    result.strategy = Strategy::Bandit;
    result.items = {{"p3", std::numeric_limits<double>::infinity(), 1},
                    {"p1", 1.5, 2}};

    auto j = result.toJson();
    EXPECT_EQ(j["strategy"], "bandit");
    EXPECT_EQ(j["status"], "ok");
    ASSERT_EQ(j["recommendations"].size(), 2u);
    EXPECT_TRUE(j["recommendations"][0]["score"].is_null());
    EXPECT_TRUE(j["recommendations"][0]["untried"].get<bool>());
    EXPECT_DOUBLE_EQ(j["recommendations"][1]["score"].get<double>(), 1.5);
    EXPECT_FALSE(j["recommendations"][1].contains("untried"));
    EXPECT_EQ(result.productIds(), (std::vector<std::string>{"p3", "p1"}));
}

TEST(RecommendationQueryTest, ParsesOptionalFields) {
    auto query = RecommendationQuery::fromJson(
        {{"user_id", "u1"}, {"category", "Books"}, {"k", 4},
         {"exclude", {"p1", "p2"}}});
    ASSERT_TRUE(query.has_value());
    EXPECT_EQ(query.value().userId, "u1");
    EXPECT_EQ(query.value().category, "Books");
    EXPECT_EQ(query.value().k, 4);
    EXPECT_EQ(query.value().exclude.size(), 2u);

    auto minimal = RecommendationQuery::fromJson({{"userId", "u2"}});
    ASSERT_TRUE(minimal.has_value());
    EXPECT_FALSE(minimal.value().k.has_value());
    EXPECT_FALSE(minimal.value().category.has_value());
}

TEST(RecommendationQueryTest, RejectsBadFields) {
    auto missing = RecommendationQuery::fromJson({{"k", 3}});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().reason, ValidationReason::MissingField);

    auto badK = RecommendationQuery::fromJson({{"user_id", "u"}, {"k", "ten"}});
    ASSERT_FALSE(badK.has_value());
    EXPECT_EQ(badK.error().reason, ValidationReason::InvalidValue);

    auto badExclude =
        RecommendationQuery::fromJson({{"user_id", "u"}, {"exclude", {1, 2}}});
    EXPECT_FALSE(badExclude.has_value());
}
