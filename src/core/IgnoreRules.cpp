#include "core/IgnoreRules.hpp"

#include <fstream>
#include <string>
#include <utility>

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/PatternMatcher.hpp"

namespace fs = std::filesystem;

namespace ctxpack {

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

/**
 * @brief Root-relative path with '/' separators
 *
 * Falls back to the path as given when it cannot be expressed relative
 * to root (e.g. a relative path checked against an absolute root).
 */
static std::string relativeGeneric(const fs::path& path, const fs::path& root) {
    fs::path rel = path.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty()) rel = path;
    return rel.generic_string();
}

IgnoreRules::IgnoreRules(const PackerConfig& config, std::vector<std::string> gitignorePatterns)
    : names(config.ignoredNames), patterns(std::move(gitignorePatterns)) {
    wildcards.reserve(config.ignoredWildcards.size());
    for (const auto& glob : config.ignoredWildcards) {
        wildcards.push_back(PatternMatcher::compileGlob(glob));
    }
    compiled.reserve(patterns.size());
    for (const auto& p : patterns) {
        CompiledPattern cp;
        cp.text = p;
        cp.directoryOnly = !p.empty() && p.back() == '/';
        cp.literal = !PatternMatcher::isPattern(p);
        if (!cp.literal) cp.regex = PatternMatcher::compileGlob(p);
        compiled.push_back(std::move(cp));
    }
}

bool IgnoreRules::CompiledPattern::matches(const std::string& candidate) const {
    if (literal) return candidate == text;
    return PatternMatcher::matches(regex, candidate);
}

Expected<std::vector<std::string>> IgnoreRules::loadGitignore(const fs::path& root) {
    std::vector<std::string> result;
    fs::path gitignorePath = root / Constants::GITIGNORE_FILENAME;

    std::error_code ec;
    if (!fs::exists(gitignorePath, ec)) {
        return result;
    }
    if (!fs::is_regular_file(gitignorePath, ec)) {
        return Error{ErrorCode::IoError, gitignorePath.string() + " is not a regular file"};
    }

    std::ifstream in(gitignorePath, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "cannot open " + gitignorePath.string()};
    }

    std::string line;
    bool first = true;
    while (std::getline(in, line)) {
        if (first) {
            // Drop a UTF-8 byte order mark
            if (line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
            first = false;
        }
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        result.push_back(line);
    }
    if (in.bad()) {
        return Error{ErrorCode::IoError, "error while reading " + gitignorePath.string()};
    }
    return result;
}

bool IgnoreRules::shouldIgnore(const fs::path& path, const fs::path& root) const {
    std::error_code ec;
    bool isDir = fs::is_directory(path, ec);
    return shouldIgnore(path, root, isDir && !ec);
}

bool IgnoreRules::shouldIgnore(const fs::path& path, const fs::path& root, bool isDirectory) const {
    const std::string name = path.filename().string();

    // 1. Exact default names
    if (names.count(name) > 0) return true;

    // 2. Default wildcards against the basename
    for (const auto& re : wildcards) {
        if (PatternMatcher::matches(re, name)) return true;
    }

    if (compiled.empty()) return false;

    // 3. .gitignore patterns
    const std::string rel = relativeGeneric(path, root);
    for (const auto& cp : compiled) {
        if (cp.directoryOnly) {
            if (isDirectory &&
                (cp.matches(rel + "/") || cp.matches(name + "/"))) {
                Logger::instance().debug(rel + " matches .gitignore pattern '" + cp.text + "'");
                return true;
            }
            continue;
        }
        if (cp.matches(rel) || cp.matches(name)) {
            Logger::instance().debug(rel + " matches .gitignore pattern '" + cp.text + "'");
            return true;
        }
    }
    return false;
}

}
