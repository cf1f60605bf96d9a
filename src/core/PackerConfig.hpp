#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace ctxpack {

/**
 * @brief Immutable selection and output settings for one pack run
 *
 * Passed by const reference into IgnoreRules and Packer so tests can swap
 * in narrower allowlists or different artifact names.
 *
 * Default ignores are kept as two explicit sets, checked in order:
 *   ignoredNames     - exact basename match (".git", "node_modules", ...)
 *   ignoredWildcards - basename glob match ("*.log", ...)
 */
struct PackerConfig {
    std::set<std::string> extensions;        // lowercase, leading dot
    std::set<std::string> ignoredNames;
    std::vector<std::string> ignoredWildcards;
    std::string outputFileName;
    std::string promptFileName;
    std::string preamble;
    std::string instructionPrompt;

    /// Build the stock configuration from Constants
    static PackerConfig defaults();

    /// True if the file's lowercased extension is in the allowlist
    bool allowsExtension(const std::filesystem::path& file) const;

    /// True for the output artifact's name, which is skipped at any depth
    bool isReservedName(const std::string& fileName) const;
};

}
