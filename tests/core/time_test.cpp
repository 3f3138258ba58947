#include "gcli/core/time.hpp"

#include <gtest/gtest.h>

using gcli::format_basic_iso8601;
using gcli::format_iso8601;
using gcli::parse_iso8601;

TEST(TimeTest, ParsesUtcDate) {
    auto parsed = parse_iso8601("2013-05-07T22:51:52Z");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), 1367967112);
}

TEST(TimeTest, IgnoresFractionalSeconds) {
    auto parsed = parse_iso8601("2013-05-07T22:51:52.339Z");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), 1367967112);
}

TEST(TimeTest, NormalisesOffsetsToUtc) {
    auto parsed = parse_iso8601("2013-05-08T00:51:52+02:00");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), 1367967112);

    auto western = parse_iso8601("2013-05-07T17:51:52-05:00");
    ASSERT_TRUE(western.is_ok());
    EXPECT_EQ(western.value(), 1367967112);
}

TEST(TimeTest, Epoch) {
    auto parsed = parse_iso8601("1970-01-01T00:00:00Z");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), 0);
}

TEST(TimeTest, RejectsMalformedInput) {
    EXPECT_TRUE(parse_iso8601("").is_error());
    EXPECT_TRUE(parse_iso8601("yesterday").is_error());
    EXPECT_TRUE(parse_iso8601("2013-13-07T22:51:52Z").is_error());
    EXPECT_TRUE(parse_iso8601("2013-05-07").is_error());

    auto bad = parse_iso8601("2013-05-07T25:00:00Z");
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().kind, gcli::ErrorKind::DataError);
}

TEST(TimeTest, Formats) {
    EXPECT_EQ(format_iso8601(1367967112), "2013-05-07T22:51:52Z");
    EXPECT_EQ(format_basic_iso8601(1367967112), "20130507T225152Z");
}

TEST(TimeTest, FormatThenParseIsIdentity) {
    const gcli::Timestamp moments[] = {0, 951782400 /* 2000-02-29 */, 1700000000, 4102444800};
    for (auto moment : moments) {
        auto parsed = parse_iso8601(format_iso8601(moment));
        ASSERT_TRUE(parsed.is_ok());
        EXPECT_EQ(parsed.value(), moment);
    }
}
