#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <vector>
#include "test_utils.hpp"
#include "core/IgnoreRules.hpp"
#include "core/PackerConfig.hpp"

namespace fs = std::filesystem;

using namespace ctxpack;
using namespace ctxpack::test::utils;

class IgnoreRulesTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        config = PackerConfig::defaults();
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
    PackerConfig config;
};

// Test: Default exact names match at any depth
TEST_F(IgnoreRulesTest, DefaultNamesMatchAnywhere) {
    IgnoreRules rules(config, {});
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "node_modules", tempDir, true));
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "a" / "b" / "node_modules", tempDir, true));
    EXPECT_TRUE(rules.shouldIgnore(tempDir / ".git", tempDir, true));
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "web" / "package-lock.json", tempDir, false));
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "logs.txt", tempDir, false));

    EXPECT_FALSE(rules.shouldIgnore(tempDir / "src", tempDir, true));
    EXPECT_FALSE(rules.shouldIgnore(tempDir / "main.py", tempDir, false));
}

// Test: Default wildcards match the basename only
TEST_F(IgnoreRulesTest, DefaultWildcards) {
    IgnoreRules rules(config, {});
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "a.log", tempDir, false));
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "deep" / "server.log", tempDir, false));
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "npm.audit.json", tempDir, false));

    EXPECT_FALSE(rules.shouldIgnore(tempDir / "catalog.json", tempDir, false));
    EXPECT_FALSE(rules.shouldIgnore(tempDir / "log.py", tempDir, false));
}

// Test: Exact default names are not treated as globs
TEST_F(IgnoreRulesTest, ExactNamesAreLiteral) {
    config.ignoredNames.insert("data[1]");
    IgnoreRules rules(config, {});
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "data[1]", tempDir, true));
    EXPECT_FALSE(rules.shouldIgnore(tempDir / "data1", tempDir, true));
}

// Test: Plain gitignore pattern matches basename or relative path
TEST_F(IgnoreRulesTest, GitignorePatternsMatchNameAndRelativePath) {
    IgnoreRules rules(config, {"*.tmp", "secret.env", "docs/*.md"});
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "x.tmp", tempDir, false));
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "src" / "y.tmp", tempDir, false));
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "config" / "secret.env", tempDir, false));
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "docs" / "intro.md", tempDir, false));

    EXPECT_FALSE(rules.shouldIgnore(tempDir / "README.md", tempDir, false));
    EXPECT_FALSE(rules.shouldIgnore(tempDir / "other" / "docs" / "intro.md", tempDir, false));
}

// Test: Trailing '/' rules only exclude directories
TEST_F(IgnoreRulesTest, DirectoryOnlyPattern) {
    // "out" is not a default name, unlike "build"
    IgnoreRules rules(config, {"out/"});
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "out", tempDir, true));
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "pkg" / "out", tempDir, true));
    EXPECT_FALSE(rules.shouldIgnore(tempDir / "out", tempDir, false));
}

// Test: Filesystem overload inspects the real entry type
TEST_F(IgnoreRulesTest, DirectoryOnlyPatternChecksFilesystem) {
    fs::create_directories(tempDir / "gen");
    createFile(tempDir, "sub/gen", "not a directory");

    IgnoreRules rules(config, {"gen/"});
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "gen", tempDir));
    EXPECT_FALSE(rules.shouldIgnore(tempDir / "sub" / "gen", tempDir));
}

// Test: Relative path is computed against the root with '/' separators
TEST_F(IgnoreRulesTest, RelativePathDirectoryPattern) {
    IgnoreRules rules(config, {"src/generated/"});
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "src" / "generated", tempDir, true));
    EXPECT_FALSE(rules.shouldIgnore(tempDir / "lib" / "generated", tempDir, true));
}

// Test: Unsupported gitignore syntax is not emulated
TEST_F(IgnoreRulesTest, PartialEmulation) {
    // Negation is just a pattern starting with '!', which never matches a real name
    IgnoreRules neg(config, {"*.tmp", "!keep.tmp"});
    EXPECT_TRUE(neg.shouldIgnore(tempDir / "keep.tmp", tempDir, false));

    // Leading '/' never matches: relative paths carry no leading separator
    IgnoreRules anchored(config, {"/vendor"});
    EXPECT_FALSE(anchored.shouldIgnore(tempDir / "vendor", tempDir, true));
}

// Test: Malformed glob is a non-match, not an error
TEST_F(IgnoreRulesTest, MalformedPatternIsIgnored) {
    IgnoreRules rules(config, {"[z-a]", "*.bak"});
    EXPECT_FALSE(rules.shouldIgnore(tempDir / "z", tempDir, false));
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "old.bak", tempDir, false));
}

// Test: Load .gitignore - comments, blanks and whitespace
TEST_F(IgnoreRulesTest, LoadGitignoreSkipsCommentsAndBlanks) {
    createFile(tempDir, ".gitignore",
               "# build output\n"
               "\n"
               "out/\r\n"
               "   *.tmp   \n"
               "\t# indented comment\n"
               "secret.env\n");

    auto res = IgnoreRules::loadGitignore(tempDir);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    std::vector<std::string> expected{"out/", "*.tmp", "secret.env"};
    EXPECT_EQ(res.value(), expected);
}

// Test: Missing .gitignore is not an error
TEST_F(IgnoreRulesTest, LoadGitignoreMissing) {
    auto res = IgnoreRules::loadGitignore(tempDir);
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value().empty());
}

// Test: .gitignore that is not a regular file reports IoError
TEST_F(IgnoreRulesTest, LoadGitignoreUnreadable) {
    fs::create_directories(tempDir / ".gitignore");
    auto res = IgnoreRules::loadGitignore(tempDir);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::IoError);
}

// Test: Injected configuration replaces the defaults
TEST_F(IgnoreRulesTest, InjectedConfig) {
    PackerConfig narrow;
    narrow.ignoredNames = {"fixtures"};
    narrow.ignoredWildcards = {"*.snap"};
    IgnoreRules rules(narrow, {});

    EXPECT_TRUE(rules.shouldIgnore(tempDir / "fixtures", tempDir, true));
    EXPECT_TRUE(rules.shouldIgnore(tempDir / "ui.snap", tempDir, false));
    EXPECT_FALSE(rules.shouldIgnore(tempDir / "node_modules", tempDir, true));
    EXPECT_FALSE(rules.shouldIgnore(tempDir / "a.log", tempDir, false));
}
