#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "util/ILauncher.hpp"

namespace ctxpack::test {

/**
 * @brief Test utilities for ctxpack tests
 *
 * Provides helper functions for creating temporary project trees,
 * test files, and cleaning up test environments.
 */
namespace utils {

/**
 * @brief Create a temporary directory for testing
 * @return Path to temporary directory
 */
std::filesystem::path createTempDir();

/**
 * @brief Remove a directory and all its contents
 * @param dir Directory to remove
 */
void removeDir(const std::filesystem::path& dir);

/**
 * @brief Create a file with content in the given directory
 * @param baseDir Base directory
 * @param filename File name (may contain subdirectories)
 * @param content File content
 * @return Full path to created file
 */
std::filesystem::path createFile(
    const std::filesystem::path& baseDir,
    const std::string& filename,
    const std::string& content = ""
);

/**
 * @brief Create multiple files in a directory
 * @param baseDir Base directory
 * @param files Vector of filename-content pairs
 */
void createFiles(
    const std::filesystem::path& baseDir,
    const std::vector<std::pair<std::string, std::string>>& files
);

/**
 * @brief Read file content (binary)
 * @param filePath Path to file
 * @return File content as string
 */
std::string readFile(const std::filesystem::path& filePath);

/**
 * @brief Relative paths of all "## File:" headings in an artifact, in order
 * @param artifact Artifact text
 */
std::vector<std::string> packedPaths(const std::string& artifact);

/**
 * @brief Get current working directory
 * @return Current working directory path
 */
std::filesystem::path getCwd();

/**
 * @brief Set working directory
 * @param dir Directory to change to
 */
void setCwd(const std::filesystem::path& dir);

/**
 * @brief Let every user read and traverse a test tree
 *
 * Directories become rwx for all, files gain group/other read. Needed
 * before handing a tree to runWithPermissionsEnforced().
 * @param dir Root of the tree
 */
void shareWithAllUsers(const std::filesystem::path& dir);

/**
 * @brief Run body with file permission bits enforced
 *
 * Root bypasses permission bits, so under root the body runs in a forked
 * child that has dropped to nobody (uid/gid 65534). Otherwise it runs in
 * process. Do not use gtest assertions inside body; return a code instead.
 * @param body Test body; its return value must fit in an exit status
 * @return body's result, or -1 if the child could not run it
 */
int runWithPermissionsEnforced(const std::function<int()>& body);

/**
 * @brief ILauncher that records calls instead of touching the desktop
 *
 * Set the fail* flags to simulate an unavailable collaborator.
 */
class RecordingLauncher : public ILauncher {
public:
    Expected<void> copyToClipboard(const std::string& text) override;
    Expected<void> openUrl(const std::string& url) override;
    Expected<void> revealInFileManager(const std::filesystem::path& file) override;

    std::vector<std::string> clipboard;
    std::vector<std::string> urls;
    std::vector<std::filesystem::path> revealed;
    bool failClipboard{false};
    bool failOpen{false};
};

} // namespace utils

} // namespace ctxpack::test
