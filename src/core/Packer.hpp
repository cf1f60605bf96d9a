#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <vector>

#include "core/ContextWriter.hpp"
#include "core/IgnoreRules.hpp"
#include "core/PackerConfig.hpp"
#include "util/Expected.hpp"

namespace ctxpack {

/**
 * @brief Totals for one completed pack run
 *
 * totalChars counts decoded code points, not on-disk bytes, and is only
 * used for the approximate size in the summary.
 */
struct PackResult {
    size_t fileCount{0};
    uint64_t totalChars{0};
    size_t readFailures{0};
    std::filesystem::path outputPath;
};

/**
 * @brief Walks a project tree and packs eligible files into one artifact
 *
 * Traversal is depth-first with entries in name order. For each directory:
 *   1. subdirectories matched by IgnoreRules are pruned before descent
 *   2. files are packed unless they carry the output artifact's name, are
 *      one of the excluded paths, IgnoreRules excludes them, or their
 *      extension is not allowlisted
 *   3. surviving subdirectories are visited (symlinked ones are not followed)
 *
 * Error policy:
 *   NotADirectory  - root missing, not a directory or not listable;
 *                    nothing written
 *   IoError        - artifact cannot be created or written
 *   Cancelled      - cancel flag raised; partial artifact is left in place
 *   NothingPacked  - no eligible files; the artifact is removed
 * Unreadable or non-regular files that would otherwise be packed are
 * logged as read errors and skipped. An unreadable .gitignore is logged
 * and ignored.
 */
class Packer {
public:
    explicit Packer(PackerConfig config, const std::atomic<bool>* cancelFlag = nullptr);

    /**
     * @brief Pack every eligible file under root into outputPath
     * @param root Traversal root
     * @param outputPath Artifact to create (truncated if present)
     * @param excludedFiles Exact files to leave out, such as side files the
     *        caller writes itself; other files with the same name still count
     * @return Totals, or an error as described above
     */
    Expected<PackResult> pack(const std::filesystem::path& root,
                              const std::filesystem::path& outputPath,
                              const std::vector<std::filesystem::path>& excludedFiles = {});

private:
    struct RunState {
        std::filesystem::path root;
        const IgnoreRules* rules{nullptr};
        ContextWriter* writer{nullptr};
        PackResult* result{nullptr};
        const std::vector<std::filesystem::path>* excluded{nullptr};
    };

    Expected<void> walkDirectory(const std::filesystem::path& dir, RunState& state);
    Expected<void> packFile(const std::filesystem::directory_entry& entry, RunState& state);
    bool cancelled() const;

    PackerConfig config;
    const std::atomic<bool>* cancelFlag;
};

}
