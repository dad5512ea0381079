#include <gtest/gtest.h>

#include "pattern_matcher.h"

TEST(PatternMatcher, WildcardForms) {
    PatternMatcher matcher;
    EXPECT_TRUE(matcher.matches_pattern("anything", "*"));
    EXPECT_TRUE(matcher.matches_pattern("", "*"));

    EXPECT_TRUE(matcher.matches_pattern("report.txt", "report*"));
    EXPECT_FALSE(matcher.matches_pattern("my-report", "report*"));

    EXPECT_TRUE(matcher.matches_pattern("archive.tar", "*.tar"));
    EXPECT_FALSE(matcher.matches_pattern("archive.tar.gz", "*.tar"));

    EXPECT_TRUE(matcher.matches_pattern("abcdef", "*cd*"));
    EXPECT_FALSE(matcher.matches_pattern("abdef", "*cd*"));
}

TEST(PatternMatcher, ExactTextAndNoOtherGlobs) {
    PatternMatcher matcher;
    EXPECT_TRUE(matcher.matches_pattern("start", "start"));
    EXPECT_FALSE(matcher.matches_pattern("started", "start"));
    EXPECT_FALSE(matcher.matches_pattern("a", "?"));
    EXPECT_TRUE(matcher.matches_pattern("?", "?"));
    EXPECT_FALSE(matcher.matches_pattern("b", "[abc]"));
}

// quoting turns wildcards into literal text
TEST(PatternMatcher, QuotedPatternsAreLiteral) {
    PatternMatcher matcher;
    EXPECT_TRUE(matcher.matches_pattern("*", "\"*\""));
    EXPECT_FALSE(matcher.matches_pattern("abc", "\"*\""));
    EXPECT_TRUE(matcher.matches_pattern("a*", "'a*'"));
    EXPECT_FALSE(matcher.matches_pattern("abc", "'a*'"));
    EXPECT_TRUE(matcher.matches_pattern("*x", "\\*x"));
    EXPECT_TRUE(matcher.matches_pattern("two words", "\"two words\""));
}
