// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

// Emits every Nth pass through this call site, counted across all battles in the process.
// Usage: BOTARENA_LOG_EVERY_N(trace, 30, "[move] blocked agent={}", id);
#define BOTARENA_LOG_EVERY_N(lvl, N, ...) \
    do { \
        static std::atomic<uint64_t> botarena_every_n_hits{0}; \
        if (botarena::log::enabled(botarena::log::level::lvl) \
            && (botarena_every_n_hits.fetch_add(1, std::memory_order_relaxed) + 1) % (N) == 0) { \
            botarena::log::lvl(__VA_ARGS__); \
        } \
    } while (0)
