#include <gtest/gtest.h>

#include "../include/errors.hpp"
#include "../include/predicate.hpp"

using json = nlohmann::json;

class PredicateTest : public ::testing::Test {
protected:
    json metadata_ = {
        {"category", "shipping"},
        {"price", 12.5},
        {"stock", 3},
        {"tags", {"intl", "express"}},
        {"warehouse", {{"region", "eu"}, {"bays", 4}}}
    };
};

TEST_F(PredicateTest, Comparisons) {
    EXPECT_TRUE(Predicate("category", "==", "shipping").matches(metadata_));
    EXPECT_FALSE(Predicate("category", "!=", "shipping").matches(metadata_));
    EXPECT_TRUE(Predicate("price", "<", 20).matches(metadata_));
    EXPECT_FALSE(Predicate("price", ">", 20).matches(metadata_));
    EXPECT_TRUE(Predicate("price", ">=", 12.5).matches(metadata_));
    EXPECT_TRUE(Predicate("stock", "<=", 3.0).matches(metadata_));
    EXPECT_TRUE(Predicate("category", ">", "returns").matches(metadata_));
}

TEST_F(PredicateTest, MissingFieldNeverMatches) {
    EXPECT_FALSE(Predicate("color", "==", "red").matches(metadata_));
    EXPECT_FALSE(Predicate("color", "!=", "red").matches(metadata_));
    EXPECT_TRUE((!Predicate("color", "==", "red")).matches(metadata_));
}

TEST_F(PredicateTest, MixedTypesDoNotOrder) {
    EXPECT_FALSE(Predicate("category", "<", 5).matches(metadata_));
    EXPECT_FALSE(Predicate("price", ">", "10").matches(metadata_));
}

TEST_F(PredicateTest, ContainsAndNestedPaths) {
    EXPECT_TRUE(Predicate("tags", "@>", "intl").matches(metadata_));
    EXPECT_TRUE(Predicate("tags", "@>", json::array({"express", "intl"})).matches(metadata_));
    EXPECT_FALSE(Predicate("tags", "@>", "economy").matches(metadata_));
    EXPECT_TRUE(Predicate("warehouse", "@>", json{{"region", "eu"}}).matches(metadata_));
    EXPECT_TRUE(Predicate("warehouse.region", "==", "eu").matches(metadata_));
    EXPECT_TRUE(Predicate("warehouse.bays", ">", 2).matches(metadata_));
    EXPECT_FALSE(Predicate("warehouse.region.code", "==", "x").matches(metadata_));
}

TEST_F(PredicateTest, LogicalOperatorsFlatten) {
    auto p = Predicate("price", "<", 20) && Predicate("stock", ">", 0) && Predicate("category", "==", "shipping");
    EXPECT_EQ(p.op(), Predicate::Op::And);
    EXPECT_EQ(p.children().size(), 3u);
    EXPECT_TRUE(p.matches(metadata_));

    auto q = Predicate("category", "==", "returns") || Predicate("category", "==", "billing");
    EXPECT_EQ(q.op(), Predicate::Op::Or);
    EXPECT_FALSE(q.matches(metadata_));
    EXPECT_TRUE((q || Predicate("price", "<", 13)).matches(metadata_));
}

TEST_F(PredicateTest, ParseExpressions) {
    auto a = Predicate::parse("price>=12.5");
    EXPECT_EQ(a.op(), Predicate::Op::Ge);
    EXPECT_EQ(a.field(), "price");
    EXPECT_EQ(a.value(), json(12.5));

    auto b = Predicate::parse(" category == shipping ");
    EXPECT_EQ(b.op(), Predicate::Op::Eq);
    EXPECT_EQ(b.value(), json("shipping"));
    EXPECT_TRUE(b.matches(metadata_));

    EXPECT_TRUE(Predicate::parse("tags@>\"intl\"").matches(metadata_));
    EXPECT_TRUE(Predicate::parse("warehouse.region=eu").matches(metadata_));
    EXPECT_TRUE(Predicate::parse("stock<>0").matches(metadata_));
}

TEST_F(PredicateTest, RejectsBadInput) {
    EXPECT_THROW(Predicate("price", "~", 1), InvalidArgument);
    EXPECT_THROW(Predicate("", "==", 1), InvalidArgument);
    EXPECT_THROW(Predicate::parse("no operator here"), InvalidArgument);
    EXPECT_THROW(Predicate::all_of({}), InvalidArgument);
}

TEST_F(PredicateTest, ToStringIsReadable) {
    auto p = Predicate("price", "<", 20) && !Predicate("category", "==", "returns");
    EXPECT_EQ(p.to_string(), "(price < 20 AND NOT (category == \"returns\"))");
}
