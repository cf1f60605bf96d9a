#include "cli/commands/PackCommand.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "core/Constants.hpp"
#include "core/Packer.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace ctxpack {

namespace {

const char* const RULE = "--------------------------------------------------";

/**
 * @brief Put the instruction prompt on the clipboard
 * @return Status line for the summary; never an error
 */
std::string copyPrompt(const AppContext& ctx) {
    if (!ctx.launcher) return "Could not copy to clipboard (no clipboard service)";
    auto res = ctx.launcher->copyToClipboard(ctx.config.instructionPrompt);
    if (!res) return "Could not copy to clipboard (" + res.error().message + ")";
    return "Copied to clipboard!";
}

Expected<void> writePromptFile(const fs::path& path, const std::string& prompt) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return Error{ErrorCode::IoError, "Failed to create " + path.string()};
    out << prompt;
    if (!out) return Error{ErrorCode::IoError, "Failed to write " + path.string()};
    return {};
}

void printSummary(const PackResult& result, const AppContext& ctx, const std::string& promptStatus, bool launch) {
    const std::string& outName = ctx.config.outputFileName;
    std::ostringstream size;
    size << std::fixed << std::setprecision(2)
         << static_cast<double>(result.totalChars) / Constants::CHARS_PER_MB;

    std::cout << RULE << "\n";
    std::cout << "SUCCESS! Context packed into: " << outName << "\n";
    std::cout << " - Files included: " << result.fileCount << "\n";
    std::cout << " - Approximate size: " << size.str() << " MB\n";
    if (result.readFailures > 0) {
        std::cout << " - Skipped (read errors): " << result.readFailures << "\n";
    }
    std::cout << RULE << "\n";
    std::cout << "INSTRUCTION PROMPT: " << promptStatus << "\n";
    std::cout << RULE << "\n";
    std::cout << "STEPS:\n";
    if (launch) {
        std::cout << "1. Gemini Web App is opening...\n";
    } else {
        std::cout << "1. Open " << Constants::ASSISTANT_URL << " in your browser.\n";
    }
    std::cout << "2. DRAG & DROP '" << outName << "' into the chat.\n";
    std::cout << "3. PASTE (Ctrl+V) the instruction prompt.\n";
    std::cout << RULE << "\n";
}

}

Expected<PackOptions> PackCommand::parseArgs(const std::vector<std::string>& args) {
    PackOptions opts;
    bool havePositional = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--path" || a == "-p") {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, "pack: " + a + " requires a value"};
            }
            opts.flagPath = args[i + 1];
            ++i;  // Skip value
        } else if (a.rfind("--path=", 0) == 0) {
            opts.flagPath = a.substr(7);
        } else if (a == "--no-launch") {
            opts.launch = false;
        } else if (a.size() > 1 && a[0] == '-') {
            return Error{ErrorCode::InvalidArgs, "pack: unknown option " + a};
        } else if (havePositional) {
            return Error{ErrorCode::InvalidArgs, "pack: unexpected argument " + a};
        } else {
            opts.positionalPath = a;
            havePositional = true;
        }
    }
    return opts;
}

fs::path PackCommand::resolveRoot(const PackOptions& opts) {
    std::string chosen = opts.positionalPath;
    if (chosen.empty()) chosen = opts.flagPath;
    if (chosen.empty()) {
        const char* env = std::getenv(Constants::ROOT_ENV_VAR);
        if (env) chosen = env;
    }

    std::error_code ec;
    fs::path root = chosen.empty() ? fs::current_path(ec) : fs::path(chosen);
    fs::path abs = fs::absolute(root, ec);
    if (ec) return root.lexically_normal();
    return abs.lexically_normal();
}

/**
 * @brief Execute 'ctxpack pack'
 *
 * 1. Resolve the project root and pack it into <cwd>/codebase_context.md
 * 2. Copy the instruction prompt to the clipboard and save it as prompt.txt
 * 3. Print the summary
 * 4. Unless --no-launch: open the assistant URL and reveal the artifact
 *
 * "Nothing packed" is reported and counts as a completed run; no prompt
 * file is written and no collaborator is launched in that case.
 */
Expected<void> PackCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parseArgs(args);
    if (!parsed) return parsed.error();
    const PackOptions& opts = parsed.value();

    fs::path root = resolveRoot(opts);

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) return Error{ErrorCode::IoError, "Cannot determine current directory: " + ec.message()};
    fs::path outputPath = cwd / ctx.config.outputFileName;
    fs::path promptPath = cwd / ctx.config.promptFileName;

    // Only the prompt file this command writes is left out, not every prompt.txt
    Packer packer(ctx.config, ctx.cancelFlag);
    auto packed = packer.pack(root, outputPath, {promptPath});
    if (!packed) {
        if (packed.error().code == ErrorCode::NothingPacked) {
            std::cout << packed.error().message << "\n";
            return {};
        }
        return packed.error();
    }
    const PackResult& result = packed.value();

    std::string promptStatus = copyPrompt(ctx);

    auto promptWritten = writePromptFile(promptPath, ctx.config.instructionPrompt);
    if (!promptWritten) {
        Logger::instance().warn(promptWritten.error().message);
    }

    printSummary(result, ctx, promptStatus, opts.launch);

    if (opts.launch && ctx.launcher) {
        auto browser = ctx.launcher->openUrl(Constants::ASSISTANT_URL);
        if (!browser) std::cout << "Could not open browser: " << browser.error().message << "\n";
        auto explorer = ctx.launcher->revealInFileManager(result.outputPath);
        if (!explorer) std::cout << "Could not open file explorer: " << explorer.error().message << "\n";
    }
    return {};
}

}
