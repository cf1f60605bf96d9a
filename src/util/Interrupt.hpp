#pragma once

#include <atomic>

namespace ctxpack {

/**
 * @brief Process-wide interrupt flag
 *
 * installHandler() routes SIGINT and SIGTERM into flag(); long-running work
 * polls the flag between units and stops with ErrorCode::Cancelled.
 */
namespace Interrupt {

std::atomic<bool>& flag();

void installHandler();

}  // namespace Interrupt

}  // namespace ctxpack
