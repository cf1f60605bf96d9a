// CLI entry: Command Pattern dispatch with `pack` as the default command.

#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/PackCommand.hpp"
#include "core/Constants.hpp"
#include "util/Interrupt.hpp"
#include "util/SystemLauncher.hpp"

using namespace ctxpack;

static void registerCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("pack", [] { return std::make_unique<PackCommand>(); });
}

int main(int argc, char** argv) {
    registerCommands();
    Interrupt::installHandler();

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    SystemLauncher launcher;
    AppContext ctx{};
    ctx.launcher = &launcher;
    ctx.cancelFlag = &Interrupt::flag();

    std::string cmdName = "pack";
    if (!args.empty() && (args.front() == "--help" || args.front() == "-h")) {
        cmdName = "help";
        args.clear();
    } else if (!args.empty() && CommandFactory::instance().has(args.front())) {
        cmdName = args.front();
        args.erase(args.begin());
    }

    auto cmd = CommandFactory::instance().create(cmdName);
    CommandInvoker invoker;
    auto res = invoker.invoke(*cmd, ctx, args);
    if (res) return 0;
    return res.error().code == ErrorCode::Cancelled ? Constants::EXIT_CANCELLED : 1;
}
