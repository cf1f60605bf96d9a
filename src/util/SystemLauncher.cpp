#include "util/SystemLauncher.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#ifdef _WIN32
#define CTXPACK_POPEN _popen
#define CTXPACK_PCLOSE _pclose
#else
#define CTXPACK_POPEN popen
#define CTXPACK_PCLOSE pclose
#endif

namespace ctxpack {

namespace {

#ifndef _WIN32
std::string shellQuote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

bool hasCommand(const std::string& name) {
    std::string cmd = "command -v " + name + " > /dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

bool hasEnv(const char* name) {
    const char* v = std::getenv(name);
    return v && *v;
}
#endif

/**
 * @brief Candidate clipboard writers for this platform, in preference order
 *
 * On Linux a helper is only offered when its display server is reachable,
 * otherwise xclip/xsel would block or fail noisily.
 */
std::vector<std::string> clipboardCommands() {
#if defined(_WIN32)
    return {"clip"};
#elif defined(__APPLE__)
    return {"pbcopy"};
#else
    std::vector<std::string> cmds;
    if (hasEnv("WAYLAND_DISPLAY") && hasCommand("wl-copy")) cmds.emplace_back("wl-copy");
    if (hasEnv("DISPLAY")) {
        if (hasCommand("xclip")) cmds.emplace_back("xclip -selection clipboard");
        if (hasCommand("xsel")) cmds.emplace_back("xsel --clipboard --input");
    }
    return cmds;
#endif
}

bool pipeTo(const std::string& cmd, const std::string& text) {
#ifndef _WIN32
    // A helper that exits early must not take the whole process down with SIGPIPE
    auto previous = std::signal(SIGPIPE, SIG_IGN);
#endif
    FILE* pipe = CTXPACK_POPEN(cmd.c_str(), "w");
    bool ok = false;
    if (pipe) {
        size_t written = std::fwrite(text.data(), 1, text.size(), pipe);
        int status = CTXPACK_PCLOSE(pipe);
        ok = written == text.size() && status == 0;
    }
#ifndef _WIN32
    std::signal(SIGPIPE, previous);
#endif
    return ok;
}

}

Expected<void> SystemLauncher::copyToClipboard(const std::string& text) {
    auto cmds = clipboardCommands();
    if (cmds.empty()) {
        return Error{ErrorCode::CollaboratorUnavailable, "no clipboard helper available"};
    }
    for (const auto& cmd : cmds) {
        if (pipeTo(cmd, text)) return {};
    }
    return Error{ErrorCode::CollaboratorUnavailable, "clipboard helper failed"};
}

Expected<void> SystemLauncher::openUrl(const std::string& url) {
#if defined(_WIN32)
    std::string cmd = "start \"\" \"" + url + "\"";
#elif defined(__APPLE__)
    std::string cmd = "open " + shellQuote(url) + " > /dev/null 2>&1";
#else
    if (!hasCommand("xdg-open")) {
        return Error{ErrorCode::CollaboratorUnavailable, "xdg-open not found"};
    }
    std::string cmd = "xdg-open " + shellQuote(url) + " > /dev/null 2>&1 &";
#endif
    if (std::system(cmd.c_str()) != 0) {
        return Error{ErrorCode::CollaboratorUnavailable, "could not open browser"};
    }
    return {};
}

Expected<void> SystemLauncher::revealInFileManager(const std::filesystem::path& file) {
#if defined(_WIN32)
    std::string cmd = "explorer /select,\"" + file.string() + "\"";
    if (std::system(cmd.c_str()) == -1) {
        return Error{ErrorCode::CollaboratorUnavailable, "could not start explorer"};
    }
    return {};
#else
#if defined(__APPLE__)
    std::string cmd = "open -R " + shellQuote(file.string()) + " > /dev/null 2>&1";
#else
    if (!hasCommand("xdg-open")) {
        return Error{ErrorCode::CollaboratorUnavailable, "xdg-open not found"};
    }
    std::string cmd = "xdg-open " + shellQuote(file.parent_path().string()) + " > /dev/null 2>&1 &";
#endif
    if (std::system(cmd.c_str()) != 0) {
        return Error{ErrorCode::CollaboratorUnavailable, "could not open file explorer"};
    }
    return {};
#endif
}

}
