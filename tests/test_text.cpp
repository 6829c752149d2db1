#include <gtest/gtest.h>

#include "text.h"

TEST(TextDecode, EmptySlugHasNoLines) {
    EXPECT_TRUE(text_decode("").empty());
}

TEST(TextDecode, UnderscoreAndDashAreSpaces) {
    EXPECT_EQ(text_decode("hello_world/foo-bar"), (vector<string>{"hello world", "foo bar"}));
}

TEST(TextDecode, DoubledCharactersAreLiterals) {
    EXPECT_EQ(text_decode("snake__case/kebab--case/''quoted''"),
              (vector<string>{"snake_case", "kebab-case", "\"quoted\""}));
}

TEST(TextDecode, TildeEscapes) {
    EXPECT_EQ(text_decode("why~q/a~ab/100~p/~h1/a~sb/c~bd/~lx~g/two~nlines"),
              (vector<string>{"why?", "a&b", "100%", "#1", "a/b", "c\\d", "<x>", "two\nlines"}));
}

TEST(TextDecode, UnknownTildeIsKept) {
    EXPECT_EQ(text_decode("~z~"), (vector<string>{"~z~"}));
}

TEST(TextDecode, BlankLinesAreEmpty) {
    EXPECT_EQ(text_decode("_/top"), (vector<string>{"", "top"}));
    EXPECT_EQ(text_decode("top/"), (vector<string>{"top", ""}));
}

TEST(TextEncode, NoLinesIsSingleBlank) {
    EXPECT_EQ(text_encode({}), "_");
    EXPECT_EQ(text_encode({""}), "_");
}

TEST(TextEncode, EscapesReservedCharacters) {
    EXPECT_EQ(text_encode({"what? 100% a/b", "say \"hi\"_-"}), "what~q_100~p_a~sb/say_''hi''__--");
}

TEST(TextNormalize, CanonicalSlugIsUnchanged) {
    auto [slug, changed] = text_normalize("abc_def/ghi");
    EXPECT_EQ(slug, "abc_def/ghi");
    EXPECT_FALSE(changed);
}

TEST(TextNormalize, DashesBecomeUnderscores) {
    auto [slug, changed] = text_normalize("abc-def");
    EXPECT_EQ(slug, "abc_def");
    EXPECT_TRUE(changed);
}

TEST(TextNormalize, TrailingSlashBecomesBlankLine) {
    auto [slug, changed] = text_normalize("top/");
    EXPECT_EQ(slug, "top/_");
    EXPECT_TRUE(changed);
}

TEST(TextNormalize, NormalizedSlugIsStable) {
    for (const string raw : {"a-b/c--d", "hello?", "x/ /y", "''quote''", "~q~z"}) {
        string once = text_normalize(raw).first;
        auto [twice, changed] = text_normalize(once);
        EXPECT_EQ(twice, once) << raw;
        EXPECT_FALSE(changed) << raw;
    }
}

TEST(Utf8Truncate, CountsCodePoints) {
    EXPECT_EQ(utf8_truncate("abcdef", 3), "abc");
    EXPECT_EQ(utf8_truncate("h\xc3\xa9llo", 2), "h\xc3\xa9");
    EXPECT_EQ(utf8_truncate("\xf0\x9f\x98\x80x", 1), "\xf0\x9f\x98\x80");
    EXPECT_EQ(utf8_truncate("ab", 10), "ab");
}
