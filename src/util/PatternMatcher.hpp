#pragma once

#include <optional>
#include <regex>
#include <string>

namespace ctxpack {

/**
 * @brief Utility functions for glob pattern matching
 *
 * Provides glob-to-regex conversion with classic fnmatch semantics.
 * Used by the ignore rules for both the wildcard defaults and the
 * patterns loaded from .gitignore.
 *
 * Supported patterns:
 *   *       -> any run of characters, '/' included
 *   ?       -> any single character
 *   [abc]   -> character class
 *   [!abc]  -> negated character class
 *
 * An unterminated '[' is taken literally. Matching is case-sensitive.
 *
 * Examples:
 *   *.log          -> matches app.log, logs/app.log
 *   docs/*.md      -> matches docs/a.md
 *   test?.py       -> matches test1.py, test2.py, etc.
 */
namespace PatternMatcher {

/**
 * @brief Convert glob pattern to std::regex
 *
 * @param pattern Glob pattern (e.g., "*.log", "build/")
 * @return std::regex anchored at both ends
 * @throws std::regex_error if the translated class is malformed (e.g. "[z-a]")
 *
 * Example: "*.log" -> "^.*\.log$"
 */
std::regex globToRegex(const std::string& pattern);

/**
 * @brief Compile a glob, mapping malformed patterns to std::nullopt
 *
 * A pattern that fails to compile must never match, so callers keep the
 * empty optional and let matches() reject every candidate.
 */
std::optional<std::regex> compileGlob(const std::string& pattern);

/// Full-string match; an uncompiled pattern matches nothing.
bool matches(const std::optional<std::regex>& compiled, const std::string& candidate);

/**
 * @brief Check if string contains glob pattern characters
 *
 * @param text String to check
 * @return true if contains *, ?, or [
 */
bool isPattern(const std::string& text);

}  // namespace PatternMatcher

}  // namespace ctxpack
