#include "util/Interrupt.hpp"

#include <csignal>

namespace ctxpack {
namespace Interrupt {

namespace {

std::atomic<bool> gInterrupted{false};

void handleSignal(int) {
    gInterrupted.store(true);
}

}

std::atomic<bool>& flag() {
    return gInterrupted;
}

void installHandler() {
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);
}

}  // namespace Interrupt
}  // namespace ctxpack
