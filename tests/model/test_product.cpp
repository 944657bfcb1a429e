// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for Product
 */

#include <gtest/gtest.h>

#include "model/product.hpp"

using namespace beacon::model;

TEST(ProductTest, ParsesCatalogEntry) {
    auto product = Product::fromJson({{"id", "p1"},
                                      {"name", "Lamp"},
                                      {"category", "Home"},
                                      {"brand", "acme"},
                                      {"price", 19.5},
                                      {"popularity", 42},
                                      {"active", true},
                                      {"inventory", 3},
                                      {"listed_at", "2024-05-01T00:00:00Z"}});
    ASSERT_TRUE(product.has_value());
    EXPECT_EQ(product.value().id, "p1");
    EXPECT_EQ(product.value().category, "Home");
    EXPECT_EQ(product.value().popularity, 42);
    EXPECT_TRUE(product.value().listedAt.has_value());
    EXPECT_TRUE(product.value().isEligible());
}

TEST(ProductTest, NumericIdsAndDefaults) {
    auto product = Product::fromJson({{"id", 17}});
    ASSERT_TRUE(product.has_value());
    EXPECT_EQ(product.value().id, "17");
    EXPECT_EQ(product.value().category, "general");
    EXPECT_EQ(product.value().inventory, 0);
    EXPECT_FALSE(product.value().isEligible());
}

TEST(ProductTest, RejectsMissingIdAndNegativeValues) {
    EXPECT_FALSE(Product::fromJson({{"name", "no id"}}).has_value());
    EXPECT_FALSE(Product::fromJson({{"id", "p"}, {"inventory", -1}}).has_value());
    EXPECT_FALSE(Product::fromJson({{"id", "p"}, {"listed_at", "soon"}})
                     .has_value());
    EXPECT_FALSE(Product::fromJson(nlohmann::json::array()).has_value());
}

TEST(ProductTest, InactiveOrOutOfStockIsNotEligible) {
    Product product;
    product.id = "p";
    product.inventory = 5;
    product.active = false;
    EXPECT_FALSE(product.isEligible());

    product.active = true;
    product.inventory = 0;
    EXPECT_FALSE(product.isEligible());
}

TEST(ProductTest, NormalizeKeyLowercases) {
    EXPECT_EQ(normalizeKey("Home-Decor"), "home-decor");
}

TEST(ProductTest, PriceBandBoundaries) {
    EXPECT_EQ(priceBandFor(0.0), PriceBand::Budget);
    EXPECT_EQ(priceBandFor(99.99), PriceBand::Budget);
    EXPECT_EQ(priceBandFor(100.0), PriceBand::MidRange);
    EXPECT_EQ(priceBandFor(499.0), PriceBand::MidRange);
    EXPECT_EQ(priceBandFor(500.0), PriceBand::Premium);
    EXPECT_EQ(priceBandFor(1000.0), PriceBand::Luxury);
    EXPECT_EQ(priceBandToString(PriceBand::MidRange), "mid_range");

    Product product;
    product.price = 750.0;
    EXPECT_EQ(product.priceBand(), PriceBand::Premium);
}
