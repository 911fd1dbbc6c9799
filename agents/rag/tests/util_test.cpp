#include <gtest/gtest.h>

#include "../include/errors.hpp"
#include "../include/util.hpp"
#include "test_support.hpp"

TEST(CsvTest, QuotedFieldsAndDelimiters) {
    auto rows = parse_csv("question;answer;category\n"
                          "\"Can I pay; later?\";\"Yes, \"\"buy now\"\" works\";payment\r\n"
                          "\n"
                          "Multi;\"line\nanswer\";misc",
                          ';');
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[1][0], "Can I pay; later?");
    EXPECT_EQ(rows[1][1], "Yes, \"buy now\" works");
    EXPECT_EQ(rows[1][2], "payment");
    EXPECT_EQ(rows[2][1], "line\nanswer");
}

TEST(CsvTest, EmptyTrailingFieldIsKept) {
    auto rows = parse_csv("a,b,\n", ',');
    ASSERT_EQ(rows.size(), 1u);
    ASSERT_EQ(rows[0].size(), 3u);
    EXPECT_EQ(rows[0][2], "");
}

TEST(CsvTest, UnterminatedQuoteThrows) {
    EXPECT_THROW(parse_csv("a;\"b\n", ';'), InvalidArgument);
}

TEST(UtilTest, SplitTrimsAndDropsEmpty) {
    auto parts = split(" a, b ,,c ", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b");
    EXPECT_EQ(parts[2], "c");
}

TEST(UtilTest, ReplaceNewlines) {
    EXPECT_EQ(replace_newlines("a\nb\r\nc"), "a b  c");
}

TEST(UtilTest, CosineDistance) {
    EXPECT_NEAR(cosine_distance({1, 2, 3}, {2, 4, 6}), 0.0, 1e-9);
    EXPECT_NEAR(cosine_distance({1, 0}, {0, 1}), 1.0, 1e-9);
    EXPECT_NEAR(cosine_distance({1, 0}, {-1, 0}), 2.0, 1e-9);
    EXPECT_DOUBLE_EQ(cosine_distance({0, 0}, {1, 0}), 1.0);
    EXPECT_DOUBLE_EQ(cosine_distance({1, 0}, {1, 0, 0}), 1.0);
}

TEST(Iso8601Test, ParsesCommonForms) {
    EXPECT_EQ(parse_iso8601("2024-03-01T12:30:15Z"), utc_seconds(1709296215));
    EXPECT_EQ(parse_iso8601("2024-03-01 12:30:15"), utc_seconds(1709296215));
    EXPECT_EQ(parse_iso8601("2024-03-01"), utc_seconds(1709251200));
    EXPECT_EQ(parse_iso8601("2024-03-01T12:30"), utc_seconds(1709296200));
    EXPECT_EQ(parse_iso8601("2024-03-01T12:30:15.5"), utc_seconds(1709296215) + std::chrono::milliseconds(500));
}

TEST(Iso8601Test, RejectsGarbage) {
    EXPECT_THROW(parse_iso8601("yesterday"), InvalidArgument);
    EXPECT_THROW(parse_iso8601("2024-13-01"), InvalidArgument);
    EXPECT_THROW(parse_iso8601("2024-03-01X12:00"), InvalidArgument);
    EXPECT_THROW(parse_iso8601("2024-03-01T12:30:15 garbage"), InvalidArgument);
    EXPECT_THROW(parse_iso8601("2024-03-01T12:30:15+2"), InvalidArgument);
    EXPECT_THROW(parse_iso8601("2024-03-01T12:30:15+25:00"), InvalidArgument);
    EXPECT_THROW(parse_iso8601("2024-03-01T12:30:15ZZ"), InvalidArgument);
}

TEST(Iso8601Test, AppliesUtcOffset) {
    EXPECT_EQ(parse_iso8601("2024-03-01T14:30:15+02:00"), utc_seconds(1709296215));
    EXPECT_EQ(parse_iso8601("2024-03-01T07:00:15-0530"), utc_seconds(1709296215));
    EXPECT_EQ(parse_iso8601("2024-03-01T12:30:15+00:00"), utc_seconds(1709296215));
    EXPECT_EQ(parse_iso8601("2024-03-01T14:30+02:00"), utc_seconds(1709296200));
}

TEST(Iso8601Test, FormatsUtc) {
    EXPECT_EQ(format_iso8601(utc_seconds(1709296215)), "2024-03-01T12:30:15");
    EXPECT_EQ(format_iso8601(utc_seconds(1709296215) + std::chrono::microseconds(250000)),
              "2024-03-01T12:30:15.250000");
}
