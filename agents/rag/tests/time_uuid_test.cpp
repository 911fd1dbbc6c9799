#include <gtest/gtest.h>

#include "../include/errors.hpp"
#include "../include/time_uuid.hpp"
#include "test_support.hpp"

TEST(TimeUuidTest, ParseAndFormat) {
    const std::string text = "c232ab00-9414-11ec-b3c8-9f6bdeced846";
    auto id = TimeUuid::parse(text);
    EXPECT_EQ(id.to_string(), text);
    EXPECT_EQ(TimeUuid::parse("C232AB00-9414-11EC-B3C8-9F6BDECED846"), id);
}

TEST(TimeUuidTest, RejectsMalformedAndNonTimeBased) {
    EXPECT_THROW(TimeUuid::parse(""), ValidationError);
    EXPECT_THROW(TimeUuid::parse("not-a-uuid"), ValidationError);
    EXPECT_THROW(TimeUuid::parse("c232ab00-9414-11ec-b3c8-9f6bdeced84g"), ValidationError);
    // version 4
    EXPECT_THROW(TimeUuid::parse("550e8400-e29b-41d4-a716-446655440000"), ValidationError);
}

TEST(TimeUuidTest, TimestampSurvivesEncoding) {
    auto t = utc_seconds(1700000000) + std::chrono::microseconds(123456);
    TimeUuid::Node node{{1, 2, 3, 4, 5, 6}};
    auto id = TimeUuid::from_time(t, 0x1234, node);
    EXPECT_EQ(id.time(), t);
    EXPECT_EQ(id.clock_seq(), 0x1234);
    EXPECT_EQ(id.bytes()[6] >> 4, 1);
    EXPECT_EQ(TimeUuid::parse(id.to_string()), id);
    EXPECT_EQ(TimeUuid::from_key(id.key()), id);
}

TEST(TimeUuidTest, OrderFollowsTimeBeforeNode) {
    auto t = utc_seconds(1700000000);
    TimeUuid::Node high{};
    high.fill(0xFF);
    auto early = TimeUuid::from_time(t, 0x3FFF, high);
    auto late = TimeUuid::from_time(t + std::chrono::microseconds(1), 0, TimeUuid::Node{});
    EXPECT_LT(early, late);
    EXPECT_LT(early.key(), late.key());
    // The textual form leads with time_low and does not sort by time; the key does.
    auto a = TimeUuid::make(0x00000001FFFFFFFFULL, 0, TimeUuid::Node{});
    auto b = TimeUuid::make(0x0000000200000000ULL, 0, TimeUuid::Node{});
    EXPECT_LT(a, b);
    EXPECT_GT(a.to_string(), b.to_string());
}

TEST(TimeUuidTest, RangeBoundsAreInclusive) {
    auto t = utc_seconds(1710000000);
    for (int i = 0; i < 20; ++i) {
        auto id = uuid_from_time(t);
        EXPECT_LE(TimeUuid::min_for(t), id);
        EXPECT_GE(TimeUuid::max_for(t), id);
    }
    auto next = t + std::chrono::microseconds(1);
    EXPECT_LT(TimeUuid::max_for(t), TimeUuid::min_for(next));
}

TEST(TimeUuidTest, RandomNodeIsMarkedMulticast) {
    auto id = uuid_from_time(std::chrono::system_clock::now());
    EXPECT_EQ(id.bytes()[10] & 0x01, 0x01);
    EXPECT_EQ(id.bytes()[8] & 0xC0, 0x80); // RFC 4122 variant
}

TEST(TimeUuidTest, GeneratorIsStrictlyIncreasingWhenClockStalls) {
    auto fixed = utc_seconds(1700000000);
    TimeUuidGenerator gen([fixed] { return fixed; });
    auto a = gen.next();
    auto b = gen.next();
    auto c = gen.next();
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_EQ(b.ticks(), a.ticks() + 1);
    EXPECT_EQ(a.time(), fixed);
}

TEST(TimeUuidTest, GeneratorSurvivesClockStepBack) {
    std::vector<TimeUuid::time_point> times = {utc_seconds(2000), utc_seconds(1000), utc_seconds(3000)};
    size_t i = 0;
    TimeUuidGenerator gen([&] { return times[i++]; });
    auto a = gen.next();
    auto b = gen.next();
    auto c = gen.next();
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_EQ(c.time(), utc_seconds(3000));
}
