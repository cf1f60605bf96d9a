#pragma once

#include <atomic>
#include <string>
#include <utility>
#include <vector>

#include "core/PackerConfig.hpp"
#include "util/Expected.hpp"
#include "util/ILauncher.hpp"

namespace ctxpack {

/**
 * @brief Services shared by all commands
 *
 * launcher may be null (no desktop integration); cancelFlag may be null
 * (run cannot be interrupted).
 */
struct AppContext {
    PackerConfig config{PackerConfig::defaults()};
    ILauncher* launcher{nullptr};
    const std::atomic<bool>* cancelFlag{nullptr};
};

class ICommand {
public:
    virtual ~ICommand() = default;
    virtual Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) = 0;
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    // Detailed help getters
    virtual const char* helpNameLine() const = 0;      // "<cmd> - <one line>"
    virtual const char* helpSynopsis() const = 0;      // usage synopsis
    virtual const char* helpDescription() const = 0;   // long description
    virtual std::vector<std::pair<std::string, std::string>> helpOptions() const = 0; // flag -> description
};

}
