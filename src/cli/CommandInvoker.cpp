#include "cli/CommandInvoker.hpp"

#include "util/Logger.hpp"

namespace ctxpack {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    auto res = cmd.execute(ctx, args);
    if (!res) {
        // An interrupt is reported, but it is not a failure of the command
        if (res.error().code == ErrorCode::Cancelled) {
            Logger::instance().info(res.error().message);
        } else {
            Logger::instance().error(std::string(cmd.name()) + ": " + res.error().message);
        }
        return res;
    }
    return {};
}

}
