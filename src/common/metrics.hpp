// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Runtime counters (atomics, no dynamic allocation) read by the periodic metrics line.
#pragma once
#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

namespace arena::metrics {

struct SnapshotCounters
{
    std::atomic<uint64_t> bytes{0};
    std::atomic<uint64_t> count{0};
    std::atomic<uint64_t> dropped_frames{0};
};

struct RuntimeCounters
{
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    // Power-of-two buckets (base 250k ns) -> up to ~128ms.
    static constexpr int TICK_BUCKETS = 10;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{}; // bucket 0:<250k,1:<500k,...
    std::atomic<uint64_t> active_matches{0};
    std::atomic<uint64_t> connected_players{0};
    std::atomic<uint64_t> malformed_inputs{0};
    std::atomic<uint64_t> invalid_frames{0};
    std::atomic<uint64_t> excluded_bodies{0};
    std::atomic<uint64_t> eliminations{0};
    std::atomic<uint64_t> matches_completed{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline SnapshotCounters &snapshot()
{
    static SnapshotCounters inst;
    return inst;
}

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
        if (cumulative >= target)
            return (base << i);
    }
    return (base << (RuntimeCounters::TICK_BUCKETS - 1));
}

inline void add_snapshot(uint64_t bytes)
{
    snapshot().bytes.fetch_add(bytes, std::memory_order_relaxed);
    snapshot().count.fetch_add(1, std::memory_order_relaxed);
}

inline void inc(std::atomic<uint64_t> &c, uint64_t n = 1)
{
    c.fetch_add(n, std::memory_order_relaxed);
}

// Single-line JSON dump of every counter.
inline std::string runtime_json()
{
    auto &rt = runtime();
    auto &sn = snapshot();
    auto ld = [](const std::atomic<uint64_t> &a) { return a.load(std::memory_order_relaxed); };
    uint64_t samples = ld(rt.tick_samples);
    uint64_t avg = samples ? ld(rt.tick_duration_ns_accum) / samples : 0;
    std::ostringstream os;
    os << "{\"tick_samples\":" << samples << ",\"tick_avg_ns\":" << avg << ",\"tick_p99_ns\":" << approx_tick_p99()
       << ",\"active_matches\":" << ld(rt.active_matches) << ",\"connected_players\":" << ld(rt.connected_players)
       << ",\"malformed_inputs\":" << ld(rt.malformed_inputs) << ",\"invalid_frames\":" << ld(rt.invalid_frames)
       << ",\"excluded_bodies\":" << ld(rt.excluded_bodies) << ",\"eliminations\":" << ld(rt.eliminations)
       << ",\"matches_completed\":" << ld(rt.matches_completed) << ",\"snapshot_bytes\":" << ld(sn.bytes)
       << ",\"snapshot_count\":" << ld(sn.count) << ",\"dropped_frames\":" << ld(sn.dropped_frames) << "}";
    return os.str();
}

} // namespace arena::metrics
