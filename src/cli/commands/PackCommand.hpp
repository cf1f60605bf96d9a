#pragma once

#include <filesystem>
#include <string>

#include "cli/ICommand.hpp"

namespace ctxpack {

/// Parsed arguments of `ctxpack pack`
struct PackOptions {
    std::string positionalPath;
    std::string flagPath;
    bool launch{true};
};

class PackCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "pack"; }
    const char* description() const override { return "Pack project sources into codebase_context.md (default)"; }
    const char* helpNameLine() const override { return "pack -  Flatten a project tree into a single Markdown context file"; }
    const char* helpSynopsis() const override { return "ctxpack [pack] [<path>] [--path|-p <path>] [--no-launch]"; }
    const char* helpDescription() const override {
        return "Walk the project root, skip ignored directories and files (built-in defaults plus the root .gitignore), "
               "and write every allowlisted source file into codebase_context.md in the current directory. "
               "The root is the first of: <path>, --path, $CONTEXT_ROOT, the current directory. "
               "The instruction prompt is copied to the clipboard and saved as prompt.txt.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"<path>", "Project root directory"},
            {"--path, -p <path>", "Project root directory (alternative to the positional form)"},
            {"--no-launch", "Do not open the browser or the file manager after packing"}
        };
    }

    /// Parse command arguments; InvalidArgs on unknown flags or a missing flag value
    static Expected<PackOptions> parseArgs(const std::vector<std::string>& args);

    /// First non-empty of positional, --path, $CONTEXT_ROOT, cwd; made absolute
    static std::filesystem::path resolveRoot(const PackOptions& opts);
};

}
