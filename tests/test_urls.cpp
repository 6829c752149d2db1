#include <gtest/gtest.h>

#include "urls.h"

TEST(UrlArg, FirstPresentAliasWins) {
    QueryParams params = {{"alt", "b"}, {"style", "a"}};
    EXPECT_EQ(url_arg(params, "default", {"style", "alt"}), "a");
    EXPECT_EQ(url_arg(params, "default", {"alt", "style"}), "b");
}

TEST(UrlArg, EmptyValuesAreSkipped) {
    QueryParams params = {{"style", ""}, {"alt", "wide"}};
    EXPECT_EQ(url_arg(params, "default", {"style", "alt"}), "wide");
    EXPECT_EQ(url_arg(params, "default", {"style"}), "default");
    EXPECT_FALSE(url_arg(params, {"background"}).has_value());
}

TEST(UrlSchema, DetectsAbsoluteUrls) {
    EXPECT_TRUE(url_schema("http://example.com/a.png"));
    EXPECT_TRUE(url_schema("https://example.com"));
    EXPECT_TRUE(url_schema("svn+ssh://host/repo"));
    EXPECT_FALSE(url_schema("bogus"));
    EXPECT_FALSE(url_schema("://missing"));
    EXPECT_FALSE(url_schema("1http://digit.first"));
    EXPECT_FALSE(url_schema("not a url://x"));
}

TEST(UrlHttp, OnlyWebSchemes) {
    EXPECT_TRUE(url_http("http://example.com/a.png"));
    EXPECT_TRUE(url_http("HTTPS://example.com/a.png"));
    EXPECT_FALSE(url_http("file:///etc/passwd"));
    EXPECT_FALSE(url_http("ftp://example.com/a.png"));
    EXPECT_FALSE(url_http("httpx://example.com"));
    EXPECT_FALSE(url_http("http:/example.com"));
    EXPECT_FALSE(url_http(""));
}

TEST(UrlFlag, ParsesBooleans) {
    QueryParams params = {{"a", "true"}, {"b", "0"}, {"c", "maybe"}};
    EXPECT_TRUE(url_flag(params, "a", false));
    EXPECT_FALSE(url_flag(params, "b", true));
    EXPECT_TRUE(url_flag(params, "c", true));
    EXPECT_FALSE(url_flag(params, "missing", false));
}

TEST(UrlEncode, EscapesReserved) {
    EXPECT_EQ(url_encode("a b&c=d/é"), "a%20b%26c%3Dd%2F%C3%A9");
    EXPECT_EQ(url_decode("a%20b+c%2f"), "a b c/");
    EXPECT_EQ(url_decode("100%"), "100%");
}

TEST(UrlRemoveParam, KeepsOtherParametersInOrder) {
    EXPECT_EQ(url_remove_param("http://h/x.png?z=1&api_key=secret&a=2", "api_key"), "http://h/x.png?z=1&a=2");
    EXPECT_EQ(url_remove_param("http://h/x.png?api_key=secret", "api_key"), "http://h/x.png");
    EXPECT_EQ(url_remove_param("http://h/x.png", "api_key"), "http://h/x.png");
}

TEST(UrlWithQuery, OmitsEmptyQuery) {
    EXPECT_EQ(url_with_query("/images/a.png", {}), "/images/a.png");
    EXPECT_EQ(url_with_query("/images/a.png", {{"width", "200"}}), "/images/a.png?width=200");
}

TEST(UrlWithQuery, OrdersByNameAndKeepsRepeatedValues) {
    QueryParams params = parse_query("width=300&style=b&height=20&style=a");
    EXPECT_EQ(url_with_query("/images/a.png", params), "/images/a.png?height=20&style=b&style=a&width=300");
}

TEST(UrlAdd, ReplacesExistingValue) {
    EXPECT_EQ(url_add("http://h/a.png?status=200&width=50", {{"status", "201"}}),
              "http://h/a.png?status=201&width=50");
    EXPECT_EQ(url_add("http://h/a.png", {{"status", "201"}}), "http://h/a.png?status=201");
}

TEST(UrlClean, DropsStraySeparators) {
    EXPECT_EQ(url_clean("http://h/a.png?"), "http://h/a.png");
    EXPECT_EQ(url_clean("http://h/a.png?&x=1&&y=2&"), "http://h/a.png?x=1&y=2");
    EXPECT_EQ(url_clean("http://h/a.png  "), "http://h/a.png");
}

TEST(ParseQuery, DecodesPairs) {
    QueryParams params = parse_query("a=1&b=x%20y&flag&&c=");
    EXPECT_EQ(params.size(), 4u);
    EXPECT_EQ(params.find("b")->second, "x y");
    EXPECT_EQ(params.find("flag")->second, "");
    EXPECT_EQ(params_without(params, "a").count("a"), 0u);
}
