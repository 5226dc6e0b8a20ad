// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide atomic counters (no allocation). The relay exposes them on its
// Prometheus endpoint; the peer client logs a summary on exit.
#pragma once
#include <atomic>
#include <cstdint>

namespace pong::metrics {

struct RelayCounters
{
    std::atomic<uint64_t> connected_players{0};
    std::atomic<uint64_t> queue_depth{0};
    std::atomic<uint64_t> active_rooms{0};
    std::atomic<uint64_t> rooms_created{0};
    std::atomic<uint64_t> tournaments_active{0};
    std::atomic<uint64_t> auth_failures{0};
    std::atomic<uint64_t> game_updates_relayed{0};
    std::atomic<uint64_t> game_updates_dropped{0}; // sender had no room partner
    std::atomic<uint64_t> malformed_frames{0};
    std::atomic<uint64_t> opponent_left_sent{0};
    std::atomic<uint64_t> heartbeat_timeouts{0};
    std::atomic<uint64_t> rejoins_accepted{0};
};

struct SyncCounters
{
    std::atomic<uint64_t> snapshots_sent{0};
    std::atomic<uint64_t> snapshots_applied{0};
    std::atomic<uint64_t> snapshots_ignored{0}; // duplicate, stale round or local authority
    std::atomic<uint64_t> hard_snaps{0};
    std::atomic<uint64_t> blends{0};
    std::atomic<uint64_t> forced_resets{0};
    std::atomic<uint64_t> paddle_updates_sent{0};
    std::atomic<uint64_t> desyncs{0};
};

struct MatchCounters
{
    std::atomic<uint64_t> active_sessions{0};
    std::atomic<uint64_t> rounds_completed{0};
    std::atomic<uint64_t> matches_finished{0};
    std::atomic<uint64_t> forfeits{0};
    std::atomic<uint64_t> connection_lost{0};
    std::atomic<uint64_t> reconnect_attempts{0};
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    // Power-of-two buckets starting at 16us: tick bodies are far below a frame.
    static constexpr int TICK_BUCKETS = 12;
    static constexpr uint64_t TICK_BASE_NS = 16'000;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{};
};

inline RelayCounters &relay()
{
    static RelayCounters inst;
    return inst;
}

inline SyncCounters &sync()
{
    static SyncCounters inst;
    return inst;
}

inline MatchCounters &match()
{
    static MatchCounters inst;
    return inst;
}

inline void add_tick_duration(uint64_t ns)
{
    auto &m = match();
    m.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    m.tick_samples.fetch_add(1, std::memory_order_relaxed);
    for (int i = 0; i < MatchCounters::TICK_BUCKETS - 1; ++i) {
        if (ns < (MatchCounters::TICK_BASE_NS << i)) {
            m.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    m.tick_hist[MatchCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

// Upper bound of the bucket holding the 99th percentile sample.
inline uint64_t approx_tick_p99()
{
    auto &m = match();
    uint64_t total = m.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99) / 100;
    uint64_t cumulative = 0;
    for (int i = 0; i < MatchCounters::TICK_BUCKETS; ++i) {
        cumulative += m.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return MatchCounters::TICK_BASE_NS << i;
    }
    return MatchCounters::TICK_BASE_NS << (MatchCounters::TICK_BUCKETS - 1);
}

inline void gauge_dec(std::atomic<uint64_t> &g)
{
    uint64_t cur = g.load(std::memory_order_relaxed);
    while (cur > 0 && !g.compare_exchange_weak(cur, cur - 1, std::memory_order_relaxed)) {
    }
}

} // namespace pong::metrics
