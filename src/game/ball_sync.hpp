// SPDX-License-Identifier: Apache-2.0
// ball_sync.hpp - authority-follows-the-ball reconciliation between the two
// peers of a networked match. The peer owning the half the ball is in
// broadcasts snapshots; the other peer blends or snaps toward them.
#pragma once
#include "game/physics.hpp"

#include "pong.pb.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>

namespace pong::game {

struct SyncTuning
{
    float authority_margin{20.f};
    float snap_threshold{30.f};
    float correction{0.6f};
    std::chrono::milliseconds snapshot_interval{20};
    uint64_t force_reset_every{100};
    std::chrono::milliseconds paddle_interval{16};
    std::chrono::milliseconds paddle_keepalive{500};
    std::chrono::milliseconds silence_limit{3000};
    uint32_t max_unconverged_snaps{10};
    std::chrono::milliseconds announce_interval{250};
    // A ball parked on the far edge waiting for the peer's round is scored
    // locally after this long.
    std::chrono::milliseconds deferred_exit_limit{1000};
};

enum class HandshakeState : uint8_t
{
    pending,
    complete
};

enum class ApplyOutcome : uint8_t
{
    blended,
    snapped,
    ignored_stale_frame,
    ignored_stale_round,
    ignored_authoritative
};

const char *to_string(ApplyOutcome o);

inline pong::Side to_wire(phys::Side s)
{
    return s == phys::Side::left ? pong::SIDE_LEFT : pong::SIDE_RIGHT;
}

inline phys::Side from_wire(pong::Side s)
{
    return s == pong::SIDE_RIGHT ? phys::Side::right : phys::Side::left;
}

class BallSync
{
public:
    using Clock = std::chrono::steady_clock;

    BallSync(phys::Side assigned_side, uint64_t nonce, SyncTuning tuning = {});

    // --- host handshake ---
    // Announce to send now, if one is due (periodic until the peer's arrives,
    // plus one reply after completing).
    std::optional<pong::GameUpdate> poll_announce(Clock::time_point now);
    void on_announce(const pong::HostAnnounce &peer);
    HandshakeState handshake() const { return m_handshake; }
    bool ready() const { return m_handshake == HandshakeState::complete; }

    phys::Side local_side() const { return m_side; }
    bool is_host() const { return m_side == phys::Side::left; }
    uint64_t nonce() const { return m_nonce; }

    // True when this peer owns the ball state for the current tick.
    bool has_authority(const phys::Court &court) const;

    // --- outbound ---
    // Snapshot when authoritative and the interval elapsed. force bypasses
    // both checks: the peer that counted a round always announces it, even
    // though the re-served ball may already sit in the other half.
    std::optional<pong::GameUpdate> make_snapshot(const phys::Simulation &sim, Clock::time_point now,
        bool force = false);
    std::optional<pong::GameUpdate> make_paddle_update(float paddle_top, Clock::time_point now);

    // --- inbound ---
    ApplyOutcome apply_snapshot(phys::Simulation &sim, const pong::SyncState &snap);
    void apply_paddle(phys::Simulation &sim, const pong::PaddleUpdate &upd) const;

    void note_inbound(Clock::time_point now) { m_last_inbound = now; }
    // No inbound traffic for the silence window.
    bool silent(Clock::time_point now) const;

    const SyncTuning &tuning() const { return m_tuning; }
    bool desynced() const { return m_desynced; }
    uint64_t frames_sent() const { return m_frame; }
    uint64_t last_applied_frame() const { return m_last_applied_frame; }
    uint32_t consecutive_snaps() const { return m_consecutive_snaps; }

private:
    pong::GameUpdate build_announce() const;

    SyncTuning m_tuning;
    phys::Side m_side;
    uint64_t m_nonce;
    std::mt19937_64 m_nonce_rng;
    HandshakeState m_handshake{HandshakeState::pending};
    std::optional<Clock::time_point> m_last_announce;
    bool m_reply_pending{false};

    uint64_t m_frame{0};
    std::optional<Clock::time_point> m_last_snapshot;
    std::optional<float> m_last_paddle_sent;
    std::optional<Clock::time_point> m_last_paddle_at;

    uint64_t m_last_applied_frame{0};
    std::optional<Clock::time_point> m_last_inbound;
    bool m_forced_seen{false};
    uint32_t m_consecutive_snaps{0};
    bool m_desynced{false};
};

} // namespace pong::game
