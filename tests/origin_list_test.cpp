#include "origin_list.hpp"

#include <gtest/gtest.h>

#include <string>

namespace cors {
namespace {

TEST(OriginListTest, EmptyConfigurationIsDisabled) {
    EXPECT_TRUE(origin_list::parse("").is_disabled());
    EXPECT_TRUE(origin_list::parse("  ,\t, ,").is_disabled());
    EXPECT_TRUE(origin_list{}.is_disabled());
    EXPECT_EQ(origin_list::parse(""), origin_list{});
}

TEST(OriginListTest, ParsesTrimmedEntries) {
    const auto list = origin_list::parse(" http://localhost:3000 ,\thttps://example.com");
    ASSERT_EQ(list.get_kind(), origin_list::kind::explicit_set);
    EXPECT_EQ(list.size(), 2U);
    EXPECT_TRUE(list.contains("http://localhost:3000"));
    EXPECT_TRUE(list.contains("https://example.com"));
    EXPECT_FALSE(list.contains(" http://localhost:3000"));
}

TEST(OriginListTest, TrimsLineBreaksAroundEntries) {
    for (const bool validate : {true, false}) {
        const auto list = origin_list::parse("http://localhost:3000,\nhttps://example.com\n", {.validate_origins = validate});
        ASSERT_EQ(list.get_kind(), origin_list::kind::explicit_set);
        EXPECT_EQ(list.size(), 2U);
        EXPECT_TRUE(list.contains("https://example.com"));
        EXPECT_FALSE(list.contains("https://example.com\n"));

        const auto crlf = origin_list::parse("\r\nhttps://example.com\r\n", {.validate_origins = validate});
        ASSERT_EQ(crlf.get_kind(), origin_list::kind::explicit_set);
        EXPECT_EQ(crlf.size(), 1U);
        EXPECT_TRUE(crlf.contains("https://example.com"));
    }
}

TEST(OriginListTest, LineBreaksOnlyIsDisabled) {
    EXPECT_TRUE(origin_list::parse("\r\n,\n").is_disabled());
}

TEST(OriginListTest, DropsEmptyEntriesAndDuplicates) {
    const auto list = origin_list::parse("https://a.example,,https://a.example, ,https://b.example,");
    EXPECT_EQ(list.size(), 2U);
}

TEST(OriginListTest, RemovesSingleTrailingSlash) {
    const auto list = origin_list::parse("https://example.com/");
    EXPECT_TRUE(list.contains("https://example.com"));
    EXPECT_FALSE(list.contains("https://example.com/"));
}

TEST(OriginListTest, MatchingIsCaseSensitive) {
    const auto list = origin_list::parse("https://Example.com");
    EXPECT_TRUE(list.contains("https://Example.com"));
    EXPECT_FALSE(list.contains("https://example.com"));
}

TEST(OriginListTest, WildcardAllowsAny) {
    const auto list = origin_list::parse("*");
    EXPECT_TRUE(list.allows_any());
    EXPECT_FALSE(list.is_disabled());
    EXPECT_EQ(list.size(), 0U);
    EXPECT_FALSE(list.contains("https://example.com"));
    EXPECT_EQ(list, origin_list::any());
}

TEST(OriginListTest, WildcardOverridesExplicitEntries) {
    EXPECT_EQ(origin_list::parse("https://a.example, *, https://b.example"), origin_list::any());
}

TEST(OriginListTest, MalformedEntriesAreSkipped) {
    const auto list = origin_list::parse("http://localhost:3000, localhost:3000, ftp://files.example, https://ok.example/path");
    ASSERT_EQ(list.size(), 1U);
    EXPECT_TRUE(list.contains("http://localhost:3000"));
}

TEST(OriginListTest, AllEntriesMalformedDisablesList) {
    EXPECT_TRUE(origin_list::parse("not-an-origin, also bad").is_disabled());
}

TEST(OriginListTest, ValidationCanBeTurnedOff) {
    const auto list = origin_list::parse("null, chrome-extension://abcdef", {.validate_origins = false});
    EXPECT_EQ(list.size(), 2U);
    EXPECT_TRUE(list.contains("null"));
    EXPECT_TRUE(list.contains("chrome-extension://abcdef"));
}

TEST(OriginListTest, ParseIsOrderIndependent) {
    EXPECT_EQ(origin_list::parse("https://a.example,https://b.example"),
              origin_list::parse("https://b.example, https://a.example, https://b.example"));
    EXPECT_NE(origin_list::parse("https://a.example"), origin_list::parse("https://b.example"));
}

TEST(OriginListTest, ToStringIsSorted) {
    EXPECT_EQ(origin_list::parse("https://b.example,https://a.example").to_string(), "https://a.example,https://b.example");
    EXPECT_EQ(origin_list::any().to_string(), "*");
    EXPECT_EQ(origin_list{}.to_string(), "<disabled>");
}

TEST(OriginValidationTest, AcceptsWellFormedOrigins) {
    EXPECT_TRUE(is_valid_origin("http://localhost"));
    EXPECT_TRUE(is_valid_origin("http://localhost:3000"));
    EXPECT_TRUE(is_valid_origin("https://chat.example.com"));
    EXPECT_TRUE(is_valid_origin("https://127.0.0.1:8443"));
    EXPECT_TRUE(is_valid_origin("http://[::1]:8080"));
    EXPECT_TRUE(is_valid_origin("https://my-app.example:65535"));
}

TEST(OriginValidationTest, RejectsMalformedOrigins) {
    EXPECT_FALSE(is_valid_origin(""));
    EXPECT_FALSE(is_valid_origin("localhost:3000"));
    EXPECT_FALSE(is_valid_origin("ws://localhost"));
    EXPECT_FALSE(is_valid_origin("https://"));
    EXPECT_FALSE(is_valid_origin("https://example.com/app"));
    EXPECT_FALSE(is_valid_origin("https://example.com?x=1"));
    EXPECT_FALSE(is_valid_origin("https://user@example.com"));
    EXPECT_FALSE(is_valid_origin("https://exa mple.com"));
    EXPECT_FALSE(is_valid_origin("https://example.com:"));
    EXPECT_FALSE(is_valid_origin("https://example.com:65536"));
    EXPECT_FALSE(is_valid_origin("https://example.com:123456"));
    EXPECT_FALSE(is_valid_origin("http://[::1"));
}

TEST(OriginValidationTest, NormalizeStripsOneSlash) {
    EXPECT_EQ(normalize_origin("https://a.example/"), "https://a.example");
    EXPECT_EQ(normalize_origin("https://a.example//"), "https://a.example/");
    EXPECT_EQ(normalize_origin("https://a.example"), "https://a.example");
    EXPECT_EQ(normalize_origin("/"), "/");
}

} // namespace
} // namespace cors
