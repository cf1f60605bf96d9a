#include "core/PackerConfig.hpp"

#include <algorithm>
#include <cctype>

#include "core/Constants.hpp"

namespace fs = std::filesystem;

namespace ctxpack {

PackerConfig PackerConfig::defaults() {
    PackerConfig cfg;
    for (const char* ext : Constants::INCLUDED_EXTENSIONS) cfg.extensions.insert(ext);
    for (const char* name : Constants::IGNORED_NAMES) cfg.ignoredNames.insert(name);
    for (const char* glob : Constants::IGNORED_WILDCARDS) cfg.ignoredWildcards.emplace_back(glob);
    cfg.outputFileName = Constants::OUTPUT_FILENAME;
    cfg.promptFileName = Constants::PROMPT_FILENAME;
    cfg.preamble = Constants::PREAMBLE;
    cfg.instructionPrompt = Constants::INSTRUCTION_PROMPT;
    return cfg;
}

bool PackerConfig::allowsExtension(const fs::path& file) const {
    // path::extension() gives "" for dot-files such as ".env"
    std::string ext = file.extension().string();
    if (ext.empty()) return false;
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extensions.count(ext) > 0;
}

bool PackerConfig::isReservedName(const std::string& fileName) const {
    return fileName == outputFileName;
}

}
