#pragma once

#include <filesystem>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

#include "core/PackerConfig.hpp"
#include "util/Expected.hpp"

namespace ctxpack {

/**
 * @brief Answers "is this path excluded?" for one traversal run
 *
 * Combines the default ignores from PackerConfig with the patterns read
 * from the root .gitignore. Patterns are compiled once on construction;
 * the object is immutable afterwards.
 *
 * Decision order (first match wins):
 *   1. basename is in the exact default set
 *   2. basename matches a default wildcard
 *   3. a .gitignore pattern matches:
 *        "dir/"  -> only directories; tested against "<rel>/" and "<name>/"
 *        other   -> tested against the '/'-separated root-relative path
 *                   and against the basename
 *
 * Intentionally partial .gitignore support: no "!" negation, no "**",
 * no leading-"/" anchoring, no nested .gitignore files.
 */
class IgnoreRules {
public:
    IgnoreRules(const PackerConfig& config, std::vector<std::string> gitignorePatterns);

    /**
     * @brief Read .gitignore patterns from the traversal root
     * @param root Traversal root
     * @return Patterns in file order, or IoError if the file exists but cannot be read
     *
     * A missing .gitignore yields an empty list. Lines are trimmed;
     * blank lines and lines starting with '#' are dropped.
     */
    static Expected<std::vector<std::string>> loadGitignore(const std::filesystem::path& root);

    /// Check a path, asking the filesystem whether it is a directory
    bool shouldIgnore(const std::filesystem::path& path, const std::filesystem::path& root) const;

    /// Check a path whose type the caller already knows
    bool shouldIgnore(const std::filesystem::path& path, const std::filesystem::path& root, bool isDirectory) const;

    /// Loaded .gitignore patterns, in file order
    const std::vector<std::string>& gitignorePatterns() const { return patterns; }

private:
    struct CompiledPattern {
        std::string text;
        bool directoryOnly{false};
        bool literal{false};              // no glob characters: plain string compare
        std::optional<std::regex> regex;  // empty if literal or the glob did not compile

        bool matches(const std::string& candidate) const;
    };

    std::set<std::string> names;
    std::vector<std::optional<std::regex>> wildcards;
    std::vector<std::string> patterns;
    std::vector<CompiledPattern> compiled;
};

}
