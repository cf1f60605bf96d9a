#include "core/Packer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "util/Logger.hpp"
#include "util/TextDecoder.hpp"

namespace fs = std::filesystem;

namespace ctxpack {

static std::string relativeTo(const fs::path& path, const fs::path& root) {
    fs::path rel = path.lexically_relative(root);
    if (rel.empty()) rel = path;
    return rel.generic_string();
}

/**
 * @brief Read a whole file as raw bytes
 *
 * @return Bytes, or ReadError carrying the OS reason
 */
static Expected<std::string> readFileBytes(const fs::path& path) {
    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::string reason = errno ? std::strerror(errno) : "cannot open file";
        return Error{ErrorCode::ReadError, reason};
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::ReadError, "read failed"};
    }
    return data;
}

Packer::Packer(PackerConfig config, const std::atomic<bool>* cancelFlag)
    : config(std::move(config)), cancelFlag(cancelFlag) {}

bool Packer::cancelled() const {
    return cancelFlag && cancelFlag->load();
}

Expected<PackResult> Packer::pack(const fs::path& rootIn,
                                  const fs::path& outputPath,
                                  const std::vector<fs::path>& excludedFiles) {
    std::error_code ec;
    fs::path root = fs::absolute(rootIn, ec).lexically_normal();
    if (ec || !fs::is_directory(root, ec)) {
        return Error{ErrorCode::NotADirectory, "The path '" + rootIn.string() + "' is not a valid directory."};
    }
    // "/a/b/" normalizes with an empty filename; drop it so relative paths come out clean
    if (!root.has_filename() && root.has_parent_path() && root != root.root_path()) {
        root = root.parent_path();
    }
    fs::directory_iterator listing(root, ec);
    if (ec) {
        return Error{ErrorCode::NotADirectory,
                     "The path '" + rootIn.string() + "' is not a readable directory: " + ec.message()};
    }

    Logger::instance().info("Scanning project at: " + root.string() + "...");

    std::vector<std::string> patterns;
    auto loaded = IgnoreRules::loadGitignore(root);
    if (loaded) {
        patterns = std::move(loaded.value());
        if (patterns.empty()) Logger::instance().debug("No .gitignore patterns; using default ignores only");
    } else {
        Logger::instance().warn("Could not read .gitignore: " + loaded.error().message);
    }
    IgnoreRules rules(config, std::move(patterns));

    ContextWriter writer;
    auto opened = writer.open(outputPath, config.preamble);
    if (!opened) return opened.error();

    PackResult result;
    result.outputPath = outputPath;

    RunState state{root, &rules, &writer, &result, &excludedFiles};
    auto walked = walkDirectory(root, state);
    writer.close();
    if (!walked) return walked.error();

    if (result.fileCount == 0) {
        fs::remove(outputPath, ec);
        return Error{ErrorCode::NothingPacked, "No matching files found to pack."};
    }
    return result;
}

Expected<void> Packer::walkDirectory(const fs::path& dir, RunState& state) {
    std::error_code ec;
    std::vector<fs::directory_entry> entries;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        Logger::instance().warn("Could not list " + relativeTo(dir, state.root) + ": " + ec.message());
        return {};
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            Logger::instance().warn("Error while listing " + relativeTo(dir, state.root) + ": " + ec.message());
            break;
        }
        entries.push_back(*it);
    }

    // Directory order is filesystem-dependent; sort so repeated runs are identical
    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        return a.path().filename().string() < b.path().filename().string();
    });

    std::vector<fs::path> subdirs;
    std::vector<fs::directory_entry> files;
    for (const auto& entry : entries) {
        std::error_code typeEc;
        if (entry.is_directory(typeEc)) {
            // Prune before descending so ignored trees are never visited
            if (state.rules->shouldIgnore(entry.path(), state.root, true)) {
                Logger::instance().debug("Pruned directory: " + relativeTo(entry.path(), state.root));
                continue;
            }
            if (entry.is_symlink(typeEc)) {
                Logger::instance().debug("Not following symlinked directory: " + relativeTo(entry.path(), state.root));
                continue;
            }
            subdirs.push_back(entry.path());
        } else {
            files.push_back(entry);
        }
    }

    for (const auto& file : files) {
        if (cancelled()) return Error{ErrorCode::Cancelled, "Operation cancelled."};
        auto res = packFile(file, state);
        if (!res) return res;
    }

    for (const auto& sub : subdirs) {
        if (cancelled()) return Error{ErrorCode::Cancelled, "Operation cancelled."};
        auto res = walkDirectory(sub, state);
        if (!res) return res;
    }
    return {};
}

Expected<void> Packer::packFile(const fs::directory_entry& entry, RunState& state) {
    const fs::path& path = entry.path();
    const std::string name = path.filename().string();
    const std::string rel = relativeTo(path, state.root);

    // A previous artifact never feeds back into a later run
    if (config.isReservedName(name)) return {};

    std::error_code ec;
    for (const auto& excluded : *state.excluded) {
        if (fs::equivalent(path, excluded, ec)) {
            Logger::instance().debug("Excluded: " + rel);
            return {};
        }
    }

    if (state.rules->shouldIgnore(path, state.root, false)) {
        Logger::instance().debug("Ignored: " + rel);
        return {};
    }
    if (!config.allowsExtension(path)) {
        return {};
    }
    if (!entry.is_regular_file(ec)) {
        Logger::instance().warn("Skipped (Read Error): " + rel + " - not a regular file");
        ++state.result->readFailures;
        return {};
    }

    auto bytes = readFileBytes(path);
    if (!bytes) {
        Logger::instance().warn("Skipped (Read Error): " + rel + " - " + bytes.error().message);
        ++state.result->readFailures;
        return {};
    }

    DecodedText decoded = TextDecoder::decodeLossy(bytes.value());
    auto written = state.writer->append(PackedFileEntry{rel, std::move(decoded.text)});
    if (!written) return written;

    ++state.result->fileCount;
    state.result->totalChars += decoded.charCount;
    Logger::instance().info("Packed: " + rel);
    return {};
}

}
