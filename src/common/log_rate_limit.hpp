// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

// Per-callsite sampled logging for the 60 Hz tick loop and the 50 Hz snapshot
// path: only every Nth call formats and enqueues a line.
// Usage: PONG_LOG_EVERY_N(debug, 120, "[sync] frame={} dx={}", frame, dx);
#define PONG_LOG_CONCAT_INNER(a, b) a##b
#define PONG_LOG_CONCAT(a, b) PONG_LOG_CONCAT_INNER(a, b)

#define PONG_LOG_EVERY_N(lvl, N, ...) \
    do { \
        static std::atomic<uint64_t> PONG_LOG_CONCAT(pong_log_every_, __LINE__){0}; \
        if ((PONG_LOG_CONCAT(pong_log_every_, __LINE__).fetch_add(1, std::memory_order_relaxed) + 1) % (N) == 0) \
            ::pong::log::lvl(__VA_ARGS__); \
    } while (0)
