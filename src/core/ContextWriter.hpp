#pragma once

#include <filesystem>
#include <fstream>
#include <string>

#include "util/Expected.hpp"

namespace ctxpack {

/**
 * @brief One packed file, alive only until it has been written
 */
struct PackedFileEntry {
    std::string relativePath;  // '/'-separated, relative to the traversal root
    std::string content;       // decoded UTF-8 text
};

/**
 * @brief Incremental writer for the aggregated Markdown artifact
 *
 * Layout:
 *   <preamble>
 *   \n## File: `<relativePath>`\n\n```\n<content>\n```\n   (once per entry)
 *
 * Each entry is flushed as soon as it is appended, so an interrupted run
 * leaves a truncated but well-formed prefix on disk.
 */
class ContextWriter {
public:
    /// Create/truncate the artifact and write the preamble
    Expected<void> open(const std::filesystem::path& path, const std::string& preamble);

    /// Append one entry section
    Expected<void> append(const PackedFileEntry& entry);

    void close();

    const std::filesystem::path& path() const { return target; }

private:
    std::ofstream out;
    std::filesystem::path target;
};

}
