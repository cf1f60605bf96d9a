#include "util/PatternMatcher.hpp"

#include <regex>

namespace ctxpack {
namespace PatternMatcher {

static bool isRegexSpecial(char c) {
    return c == '.' || c == '+' || c == '[' || c == ']' || c == '(' || c == ')' ||
           c == '{' || c == '}' || c == '^' || c == '$' || c == '|' || c == '\\' ||
           c == '*' || c == '?';
}

/**
 * @brief Translate the bracket expression starting at pattern[start]
 *
 * @return Index one past the closing ']', or npos if the bracket is
 *         unterminated (caller then emits a literal '[')
 */
static size_t translateBracket(const std::string& pattern, size_t start, std::string& out) {
    size_t n = pattern.size();
    size_t j = start + 1;
    if (j < n && pattern[j] == '!') ++j;
    if (j < n && pattern[j] == ']') ++j;
    while (j < n && pattern[j] != ']') ++j;
    if (j >= n) return std::string::npos;

    std::string body = pattern.substr(start + 1, j - start - 1);
    std::string cls = "[";
    size_t k = 0;
    if (!body.empty() && body[0] == '!') {
        cls += '^';
        k = 1;
    } else if (!body.empty() && body[0] == '^') {
        cls += "\\^";
        k = 1;
    }
    for (; k < body.size(); ++k) {
        char c = body[k];
        if (c == '\\' || c == ']' || c == '[') cls += '\\';
        cls += c;
    }
    cls += ']';
    out += cls;
    return j + 1;
}

std::regex globToRegex(const std::string& pattern) {
    std::string regexStr = "^";  // Anchor at start
    size_t i = 0;
    size_t n = pattern.size();
    while (i < n) {
        char c = pattern[i];
        if (c == '*') {
            // fnmatch semantics: '*' also crosses '/'; collapse runs of '*'
            while (i < n && pattern[i] == '*') ++i;
            regexStr += ".*";
            continue;
        }
        if (c == '?') {
            regexStr += ".";
        } else if (c == '[') {
            size_t next = translateBracket(pattern, i, regexStr);
            if (next != std::string::npos) {
                i = next;
                continue;
            }
            regexStr += "\\[";
        } else if (isRegexSpecial(c)) {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
        ++i;
    }
    regexStr += "$";  // Anchor at end
    return std::regex(regexStr);
}

std::optional<std::regex> compileGlob(const std::string& pattern) {
    try {
        return globToRegex(pattern);
    } catch (const std::regex_error&) {
        return std::nullopt;
    }
}

bool matches(const std::optional<std::regex>& compiled, const std::string& candidate) {
    if (!compiled) return false;
    return std::regex_match(candidate, *compiled);
}

bool isPattern(const std::string& text) {
    return text.find('*') != std::string::npos ||
           text.find('?') != std::string::npos ||
           text.find('[') != std::string::npos;
}

}  // namespace PatternMatcher
}  // namespace ctxpack
