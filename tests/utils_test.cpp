#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "src/utils/log_utils.hpp"
#include "src/utils/string_utils.hpp"

TEST(StringUtils, PercentEncodeMatchesUriComponentRules) {
    EXPECT_EQ(string_utils::percent_encode("AZaz09-_.!~*'()"), "AZaz09-_.!~*'()");
    EXPECT_EQ(string_utils::percent_encode(" &=+/?#%"), "%20%26%3D%2B%2F%3F%23%25");
    EXPECT_EQ(string_utils::percent_encode("é"), "%C3%A9");
    EXPECT_EQ(string_utils::percent_encode(""), "");
}

TEST(StringUtils, SplitDropsBlankEntriesAndTrims) {
    const auto parts = string_utils::split_comma_delimited_string("  a ,b,, \t ,c  ");
    ASSERT_EQ(parts.size(), 3U);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b");
    EXPECT_EQ(parts[2], "c");
}

TEST(StringUtils, StripQuery) {
    EXPECT_EQ(string_utils::strip_query("GET https://a.test/join?code=1&name=2"), "GET https://a.test/join");
    EXPECT_EQ(string_utils::strip_query("POST https://a.test/join"), "POST https://a.test/join");
}

TEST(StringUtils, ParseLong) {
    EXPECT_EQ(string_utils::parse_long(" 42 "), 42);
    EXPECT_FALSE(string_utils::parse_long("4x").has_value());
    EXPECT_FALSE(string_utils::parse_long("").has_value());
}

TEST(StringUtils, StripBomRemovesOnlyLeadingMark) {
    EXPECT_EQ(string_utils::strip_bom("\xEF\xBB\xBF{\"a\":1}"), "{\"a\":1}");
    EXPECT_EQ(string_utils::strip_bom("x\xEF\xBB\xBF"), "x\xEF\xBB\xBF");
    EXPECT_EQ(string_utils::strip_bom("\xEF\xBB"), "\xEF\xBB");
    EXPECT_EQ(string_utils::strip_bom(""), "");
}

TEST(StringUtils, ToValidUtf8ReplacesBadSequences) {
    EXPECT_EQ(string_utils::to_valid_utf8("Caf\xE9 error"), "Caf\xEF\xBF\xBD error");
    EXPECT_EQ(string_utils::to_valid_utf8("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
    // A truncated three-byte sequence is one maximal subpart.
    EXPECT_EQ(string_utils::to_valid_utf8("\xE2\x82"), "\xEF\xBF\xBD");
    // Surrogates encoded as UTF-8 are rejected byte by byte.
    EXPECT_EQ(string_utils::to_valid_utf8("\xED\xA0\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(string_utils::to_valid_utf8("Zo\xC3\xAB \xE2\x82\xAC \xF0\x9F\x98\x80"), "Zo\xC3\xAB \xE2\x82\xAC \xF0\x9F\x98\x80");
}

TEST(LogUtils, FiltersBelowThreshold) {
    std::ostringstream sink;
    log_utils::set_sink(&sink);
    log_utils::set_level(log_utils::Level::WARN);

    log_utils::info("hidden");
    log_utils::warn("shown");

    log_utils::set_sink(nullptr);
    log_utils::set_level(log_utils::Level::INFO);

    EXPECT_EQ(sink.str(), "[join_relay] WARN shown\n");
}

TEST(LogUtils, ParseLevel) {
    EXPECT_EQ(log_utils::parse_level("DEBUG"), log_utils::Level::DEBUG);
    EXPECT_EQ(log_utils::parse_level("warning"), log_utils::Level::WARN);
    EXPECT_FALSE(log_utils::parse_level("verbose").has_value());
}
