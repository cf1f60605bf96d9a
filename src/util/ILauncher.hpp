#pragma once

#include <filesystem>
#include <string>

#include "util/Expected.hpp"

namespace ctxpack {

/**
 * @brief Strategy interface for host desktop services
 *
 * Wraps the side effects triggered after a successful pack: clipboard,
 * default browser and the OS file manager. Every call reports
 * ErrorCode::CollaboratorUnavailable on failure; callers turn that into a
 * status line and carry on.
 */
class ILauncher {
public:
    virtual ~ILauncher() = default;

    /// Place text on the host clipboard
    virtual Expected<void> copyToClipboard(const std::string& text) = 0;

    /// Open a URL in the default browser
    virtual Expected<void> openUrl(const std::string& url) = 0;

    /// Show a file in the OS file manager (or its directory where selection is unsupported)
    virtual Expected<void> revealInFileManager(const std::filesystem::path& file) = 0;
};

}
