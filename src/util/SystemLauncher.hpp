#pragma once

#include "util/ILauncher.hpp"

namespace ctxpack {

/**
 * @brief ILauncher backed by the host's command-line helpers
 *
 * Linux:   wl-copy / xclip / xsel, xdg-open
 * macOS:   pbcopy, open, open -R
 * Windows: clip, start, explorer /select,
 *
 * Browser and file manager are started detached; success means the helper
 * was found and launched, not that a window actually appeared.
 */
class SystemLauncher : public ILauncher {
public:
    Expected<void> copyToClipboard(const std::string& text) override;
    Expected<void> openUrl(const std::string& url) override;
    Expected<void> revealInFileManager(const std::filesystem::path& file) override;
};

}
