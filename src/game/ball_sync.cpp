// SPDX-License-Identifier: Apache-2.0
#include "game/ball_sync.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <cmath>

namespace pong::game {

namespace {

uint64_t wall_ms()
{
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace

const char *to_string(ApplyOutcome o)
{
    switch (o) {
        case ApplyOutcome::blended:
            return "blended";
        case ApplyOutcome::snapped:
            return "snapped";
        case ApplyOutcome::ignored_stale_frame:
            return "ignored_stale_frame";
        case ApplyOutcome::ignored_stale_round:
            return "ignored_stale_round";
        case ApplyOutcome::ignored_authoritative:
            return "ignored_authoritative";
    }
    return "unknown";
}

BallSync::BallSync(phys::Side assigned_side, uint64_t nonce, SyncTuning tuning)
    : m_tuning(tuning), m_side(assigned_side), m_nonce(nonce), m_nonce_rng(nonce ^ 0x9e3779b97f4a7c15ull)
{}

pong::GameUpdate BallSync::build_announce() const
{
    pong::GameUpdate upd;
    auto *ann = upd.mutable_host_announce();
    ann->set_side(to_wire(m_side));
    ann->set_nonce(m_nonce);
    return upd;
}

std::optional<pong::GameUpdate> BallSync::poll_announce(Clock::time_point now)
{
    if (m_reply_pending) {
        m_reply_pending = false;
        m_last_announce = now;
        return build_announce();
    }
    if (m_handshake == HandshakeState::complete)
        return std::nullopt;
    if (m_last_announce && now - *m_last_announce < m_tuning.announce_interval)
        return std::nullopt;
    m_last_announce = now;
    return build_announce();
}

void BallSync::on_announce(const pong::HostAnnounce &peer)
{
    const phys::Side peer_side = from_wire(peer.side());
    if (peer_side != m_side) {
        if (m_handshake == HandshakeState::pending) {
            m_handshake = HandshakeState::complete;
            m_reply_pending = true;
            log::info("[sync] handshake complete side={} host={}", phys::to_string(m_side), is_host());
        }
        return;
    }
    // Both claim the same side: the lower nonce keeps it.
    if (peer.nonce() == m_nonce) {
        m_nonce = m_nonce_rng();
        m_reply_pending = true;
        log::warn("[sync] side claim tie on {}, redrawing nonce", phys::to_string(m_side));
        return;
    }
    if (peer.nonce() < m_nonce) {
        const phys::Side was = m_side;
        m_side = phys::opposite(m_side);
        m_handshake = HandshakeState::pending;
        m_reply_pending = true;
        log::warn("[sync] side conflict: yielding {} and taking {}", phys::to_string(was), phys::to_string(m_side));
    } else {
        log::debug("[sync] side conflict: keeping {} (nonce {} < {})", phys::to_string(m_side), m_nonce, peer.nonce());
    }
}

bool BallSync::has_authority(const phys::Court &court) const
{
    const bool on_host_half = court.ball.pos.x <= court.center_x() + m_tuning.authority_margin;
    return on_host_half == is_host();
}

std::optional<pong::GameUpdate> BallSync::make_snapshot(const phys::Simulation &sim, Clock::time_point now,
    bool force)
{
    if (!ready() || (!force && !has_authority(sim.court())))
        return std::nullopt;
    if (!force && m_last_snapshot && now - *m_last_snapshot < m_tuning.snapshot_interval)
        return std::nullopt;
    m_last_snapshot = now;
    ++m_frame;

    const phys::Court &c = sim.court();
    pong::GameUpdate upd;
    auto *st = upd.mutable_sync_state();
    auto *ball = st->mutable_ball();
    ball->set_x(c.ball.pos.x);
    ball->set_y(c.ball.pos.y);
    ball->set_vx(c.ball.vel.x);
    ball->set_vy(c.ball.vel.y);
    ball->set_speed(c.ball.speed);
    ball->set_radius(c.ball.radius);
    st->set_left_paddle_y(c.left.y);
    st->set_right_paddle_y(c.right.y);
    st->set_frame(m_frame);
    st->set_force_reset(m_tuning.force_reset_every > 0 && m_frame % m_tuning.force_reset_every == 0);
    st->set_rounds_played(sim.rounds_played());
    st->set_left_score(sim.score(phys::Side::left));
    st->set_right_score(sim.score(phys::Side::right));
    st->set_host_side(pong::SIDE_LEFT);
    st->set_sent_ms(wall_ms());
    metrics::sync().snapshots_sent.fetch_add(1, std::memory_order_relaxed);
    return upd;
}

std::optional<pong::GameUpdate> BallSync::make_paddle_update(float paddle_top, Clock::time_point now)
{
    const bool changed = !m_last_paddle_sent || *m_last_paddle_sent != paddle_top;
    const auto since = m_last_paddle_at ? now - *m_last_paddle_at : Clock::duration::max();
    const bool due = changed ? since >= m_tuning.paddle_interval : since >= m_tuning.paddle_keepalive;
    if (!due)
        return std::nullopt;
    m_last_paddle_sent = paddle_top;
    m_last_paddle_at = now;
    pong::GameUpdate upd;
    upd.mutable_paddle()->set_paddle_y(paddle_top);
    upd.mutable_paddle()->set_sent_ms(wall_ms());
    metrics::sync().paddle_updates_sent.fetch_add(1, std::memory_order_relaxed);
    return upd;
}

ApplyOutcome BallSync::apply_snapshot(phys::Simulation &sim, const pong::SyncState &snap)
{
    auto &counters = metrics::sync();
    if (snap.frame() <= m_last_applied_frame) {
        counters.snapshots_ignored.fetch_add(1, std::memory_order_relaxed);
        return ApplyOutcome::ignored_stale_frame;
    }
    if (snap.rounds_played() < sim.rounds_played()) {
        counters.snapshots_ignored.fetch_add(1, std::memory_order_relaxed);
        return ApplyOutcome::ignored_stale_round;
    }
    const bool new_round = snap.rounds_played() > sim.rounds_played();
    if (!new_round && !snap.force_reset() && has_authority(sim.court())) {
        counters.snapshots_ignored.fetch_add(1, std::memory_order_relaxed);
        return ApplyOutcome::ignored_authoritative;
    }
    if (new_round) {
        auto skipped = sim.adopt_round(snap.rounds_played(), snap.left_score(), snap.right_score());
        log::debug("[sync] adopted round {} ({} skipped) score {}-{}", snap.rounds_played(), skipped,
            snap.left_score(), snap.right_score());
    }
    m_last_applied_frame = snap.frame();

    phys::Court &court = sim.court();
    phys::Ball &ball = court.ball;
    const b2Vec2 remote{snap.ball().x(), snap.ball().y()};
    const float dx = std::fabs(remote.x - ball.pos.x);
    const float dy = std::fabs(remote.y - ball.pos.y);
    const bool snap_now = snap.force_reset() || new_round || dx > m_tuning.snap_threshold
        || dy > m_tuning.snap_threshold;

    ApplyOutcome out;
    if (snap_now) {
        ball.pos = remote;
        out = ApplyOutcome::snapped;
        counters.hard_snaps.fetch_add(1, std::memory_order_relaxed);
        if (snap.force_reset()) {
            m_forced_seen = true;
            counters.forced_resets.fetch_add(1, std::memory_order_relaxed);
        } else if (m_forced_seen && !new_round && ++m_consecutive_snaps >= m_tuning.max_unconverged_snaps
            && !m_desynced) {
            m_desynced = true;
            counters.desyncs.fetch_add(1, std::memory_order_relaxed);
            log::error("[sync] {} consecutive hard snaps after forced reset, giving up", m_consecutive_snaps);
        }
    } else {
        ball.pos = b2Lerp(ball.pos, remote, m_tuning.correction);
        m_consecutive_snaps = 0;
        out = ApplyOutcome::blended;
        counters.blends.fetch_add(1, std::memory_order_relaxed);
    }
    ball.vel = b2Vec2{snap.ball().vx(), snap.ball().vy()};
    ball.speed = snap.ball().speed();

    const phys::Side opp = phys::opposite(m_side);
    const float opp_top = opp == phys::Side::left ? snap.left_paddle_y() : snap.right_paddle_y();
    phys::set_paddle_top(court.paddle(opp), opp_top, court.height);

    counters.snapshots_applied.fetch_add(1, std::memory_order_relaxed);
    PONG_LOG_EVERY_N(debug, 120, "[sync] frame={} {} dx={} dy={}", snap.frame(), to_string(out), dx, dy);
    return out;
}

void BallSync::apply_paddle(phys::Simulation &sim, const pong::PaddleUpdate &upd) const
{
    phys::Court &court = sim.court();
    phys::set_paddle_top(court.paddle(phys::opposite(m_side)), upd.paddle_y(), court.height);
}

bool BallSync::silent(Clock::time_point now) const
{
    return m_last_inbound && now - *m_last_inbound >= m_tuning.silence_limit;
}

} // namespace pong::game
