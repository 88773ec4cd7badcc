// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide battle counters (atomics, no dynamic allocation). Shared by every battle in the process.
#pragma once
#include <atomic>
#include <cstdint>

namespace botarena::metrics {

struct RuntimeCounters
{
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    // Power-of-two buckets for tick durations (base 250k ns) -> up to ~128ms.
    static constexpr int TICK_BUCKETS = 10;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{}; // bucket 0:<250k,1:<500k,...
    // Battle lifecycle
    std::atomic<uint64_t> battles_started{0};
    std::atomic<uint64_t> battles_finished{0};
    std::atomic<uint64_t> battles_cancelled{0};
    // Combat
    std::atomic<uint64_t> shots_fired{0};
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> heals{0};
    std::atomic<uint64_t> blocked_shots{0};
    std::atomic<uint64_t> kills{0};
    // Stalemate escalation
    std::atomic<uint64_t> stalemate_engagements{0};
    std::atomic<uint64_t> dispersal_engagements{0};
    // Gauge: projectiles alive at the end of the latest tick
    std::atomic<uint64_t> projectiles_active{0};
    // Rotated collision mask cache
    std::atomic<uint64_t> mask_cache_hits{0};
    std::atomic<uint64_t> mask_cache_misses{0};
    std::atomic<uint64_t> mask_cache_evictions{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline void inc(std::atomic<uint64_t> &c, uint64_t n = 1)
{
    c.fetch_add(n, std::memory_order_relaxed);
}

inline uint64_t get(const std::atomic<uint64_t> &c)
{
    return c.load(std::memory_order_relaxed);
}

// --- Tick duration histogram ---
inline void add_tick_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.tick_samples.fetch_add(1, std::memory_order_relaxed);
    constexpr uint64_t base = 250000; // 0.25ms
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        uint64_t bound = base << i;
        if (ns < bound) {
            rt.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.tick_hist[RuntimeCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

inline uint64_t approx_tick_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99 - 1) / 100; // ceil(total*0.99)
    constexpr uint64_t base = 250000;
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target) {
            return (base << i);
        }
    }
    return (base << (RuntimeCounters::TICK_BUCKETS - 1));
}

inline uint64_t avg_tick_ns()
{
    auto &rt = runtime();
    uint64_t n = rt.tick_samples.load(std::memory_order_relaxed);
    return n ? rt.tick_duration_ns_accum.load(std::memory_order_relaxed) / n : 0;
}

} // namespace botarena::metrics
