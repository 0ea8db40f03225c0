// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/session/session_manager.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <cstdint>
#include <memory>

namespace arena::net {

// Starts the TCP accept loop on the given port. Each connection gets its own coroutine
// whose read poll timeout is derived from tick_rate so outbound snapshots flush once per tick.
coro::task<void> run_listener(std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<session::SessionManager> sessions, uint16_t port, uint32_t tick_rate,
    std::shared_ptr<std::atomic<bool>> running);

} // namespace arena::net
