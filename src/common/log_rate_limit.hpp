// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

// Per-callsite rate-limited logging: emits every Nth invocation at the given level.
// Usage: ARENA_LOG_EVERY_N(warn, 100, "malformed input from player {}", id);
// The counter is atomic because receive coroutines may run on several io threads.
#define ARENA_LOG_EVERY_N(level, N, ...) \
    do { \
        static std::atomic<uint64_t> _arena_log_counter_##__LINE__{0}; \
        if ((_arena_log_counter_##__LINE__.fetch_add(1, std::memory_order_relaxed) % (N)) == 0) { \
            arena::log::level(__VA_ARGS__); \
        } \
    } while (0)
