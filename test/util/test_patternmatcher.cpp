#include <gtest/gtest.h>
#include <regex>
#include <string>
#include "util/PatternMatcher.hpp"

using namespace ctxpack;

// Test: Convert glob to regex
TEST(PatternMatcherTest, GlobToRegex) {
    std::regex regex1 = PatternMatcher::globToRegex("*.log");
    EXPECT_TRUE(std::regex_match("app.log", regex1));
    EXPECT_TRUE(std::regex_match(".log", regex1));
    EXPECT_FALSE(std::regex_match("app.log.txt", regex1));
    EXPECT_FALSE(std::regex_match("applog", regex1));  // '.' is literal

    // Question mark pattern
    std::regex regex2 = PatternMatcher::globToRegex("file?.txt");
    EXPECT_TRUE(std::regex_match("file1.txt", regex2));
    EXPECT_TRUE(std::regex_match("file2.txt", regex2));
    EXPECT_FALSE(std::regex_match("file10.txt", regex2)); // Too long
    EXPECT_FALSE(std::regex_match("file.txt", regex2));   // Too short
}

// Test: '*' crosses directory separators (fnmatch semantics)
TEST(PatternMatcherTest, StarMatchesSeparator) {
    std::regex re = PatternMatcher::globToRegex("docs/*.md");
    EXPECT_TRUE(std::regex_match("docs/intro.md", re));
    EXPECT_TRUE(std::regex_match("docs/guide/setup.md", re));
    EXPECT_FALSE(std::regex_match("src/docs/intro.md", re));

    std::regex any = PatternMatcher::globToRegex("*.pyc");
    EXPECT_TRUE(std::regex_match("pkg/sub/mod.pyc", any));
}

// Test: Bracket classes and negation
TEST(PatternMatcherTest, CharacterClasses) {
    std::regex re = PatternMatcher::globToRegex("test[0-9].py");
    EXPECT_TRUE(std::regex_match("test3.py", re));
    EXPECT_FALSE(std::regex_match("testx.py", re));

    std::regex neg = PatternMatcher::globToRegex("[!a]*.txt");
    EXPECT_TRUE(std::regex_match("notes.txt", neg));
    EXPECT_FALSE(std::regex_match("alpha.txt", neg));

    // ']' right after '[' is part of the class
    std::regex bracket = PatternMatcher::globToRegex("[]]x");
    EXPECT_TRUE(std::regex_match("]x", bracket));
}

// Test: Regex metacharacters in a glob are literal
TEST(PatternMatcherTest, EscapesRegexSpecials) {
    std::regex re = PatternMatcher::globToRegex("a+b(1).{x}$");
    EXPECT_TRUE(std::regex_match("a+b(1).{x}$", re));
    EXPECT_FALSE(std::regex_match("aab1x", re));
}

// Test: Unterminated '[' is a literal character
TEST(PatternMatcherTest, UnterminatedBracketIsLiteral) {
    auto re = PatternMatcher::compileGlob("weird[name");
    ASSERT_TRUE(re.has_value());
    EXPECT_TRUE(PatternMatcher::matches(re, "weird[name"));
    EXPECT_FALSE(PatternMatcher::matches(re, "weirdname"));
}

// Test: A pattern that cannot compile never matches
TEST(PatternMatcherTest, MalformedPatternNeverMatches) {
    auto re = PatternMatcher::compileGlob("[z-a]");
    EXPECT_FALSE(re.has_value());
    EXPECT_FALSE(PatternMatcher::matches(re, "z"));
    EXPECT_FALSE(PatternMatcher::matches(re, "[z-a]"));
}

// Test: Matching is case-sensitive
TEST(PatternMatcherTest, CaseSensitive) {
    auto re = PatternMatcher::compileGlob("*.LOG");
    EXPECT_TRUE(PatternMatcher::matches(re, "app.LOG"));
    EXPECT_FALSE(PatternMatcher::matches(re, "app.log"));
}

// Test: Check if string is a pattern
TEST(PatternMatcherTest, IsPattern) {
    EXPECT_TRUE(PatternMatcher::isPattern("*.txt"));
    EXPECT_TRUE(PatternMatcher::isPattern("file?"));
    EXPECT_TRUE(PatternMatcher::isPattern("[ab].c"));

    EXPECT_FALSE(PatternMatcher::isPattern("node_modules"));
    EXPECT_FALSE(PatternMatcher::isPattern("build/"));
    EXPECT_FALSE(PatternMatcher::isPattern(""));
}
