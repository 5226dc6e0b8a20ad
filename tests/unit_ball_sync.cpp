// SPDX-License-Identifier: Apache-2.0
#include "game/ball_sync.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace pong;
using namespace std::chrono_literals;
using Clock = game::BallSync::Clock;

static bool near(float a, float b, float eps = 1e-4f)
{
    return std::fabs(a - b) <= eps;
}

static pong::SyncState make_state(uint64_t frame, float x, float y, float vx, float vy, uint32_t rounds = 0)
{
    pong::SyncState st;
    st.set_frame(frame);
    st.mutable_ball()->set_x(x);
    st.mutable_ball()->set_y(y);
    st.mutable_ball()->set_vx(vx);
    st.mutable_ball()->set_vy(vy);
    st.mutable_ball()->set_speed(std::hypot(vx, vy));
    st.mutable_ball()->set_radius(5.f);
    st.set_rounds_played(rounds);
    st.set_left_paddle_y(100.f);
    st.set_right_paddle_y(250.f);
    st.set_host_side(pong::SIDE_LEFT);
    return st;
}

static void handshake(game::BallSync &a, game::BallSync &b, Clock::time_point now)
{
    for (int i = 0; i < 8 && !(a.ready() && b.ready()); ++i) {
        if (auto ann = a.poll_announce(now))
            b.on_announce(ann->host_announce());
        if (auto ann = b.poll_announce(now))
            a.on_announce(ann->host_announce());
        now += 250ms;
    }
}

static void test_handshake()
{
    auto now = Clock::now();
    game::BallSync a(phys::Side::left, 1), b(phys::Side::right, 2);
    assert(!a.ready() && !b.ready());
    handshake(a, b, now);
    assert(a.ready() && b.ready());
    assert(a.is_host() && !b.is_host());
    // One reply after completing, then quiet.
    assert(a.poll_announce(now));
    assert(!a.poll_announce(now + 10s));
    assert(!b.poll_announce(now + 10s));

    // Both claim left: the lower nonce keeps it.
    game::BallSync x(phys::Side::left, 5), y(phys::Side::left, 9);
    handshake(x, y, now);
    assert(x.ready() && y.ready());
    assert(x.local_side() == phys::Side::left);
    assert(y.local_side() == phys::Side::right);

    // Equal nonces are redrawn until the claim resolves.
    game::BallSync p(phys::Side::right, 7), q(phys::Side::right, 7);
    pong::HostAnnounce ann;
    ann.set_side(pong::SIDE_RIGHT);
    ann.set_nonce(7);
    p.on_announce(ann);
    assert(!p.ready() && p.nonce() != 7);
    handshake(p, q, now);
    assert(p.ready() && q.ready());
    assert(p.local_side() != q.local_side());
}

static void test_authority()
{
    game::MatchConfig cfg;
    phys::Simulation sim(cfg, 3);
    game::BallSync host(phys::Side::left, 1), guest(phys::Side::right, 2);
    auto &ball = sim.court().ball;
    ball.pos = {100.f, 200.f};
    assert(host.has_authority(sim.court()) && !guest.has_authority(sim.court()));
    ball.pos = {419.f, 200.f}; // inside the margin past centre
    assert(host.has_authority(sim.court()));
    ball.pos = {421.f, 200.f};
    assert(!host.has_authority(sim.court()) && guest.has_authority(sim.court()));
}

static void test_snapshot_production()
{
    game::MatchConfig cfg;
    phys::Simulation sim(cfg, 3);
    sim.start();
    game::BallSync host(phys::Side::left, 1), guest(phys::Side::right, 2);
    auto now = Clock::now();
    sim.court().ball.pos = {200.f, 200.f};
    assert(!host.make_snapshot(sim, now)); // no handshake yet
    handshake(host, guest, now);

    auto s1 = host.make_snapshot(sim, now);
    assert(s1 && s1->sync_state().frame() == 1);
    assert(!host.make_snapshot(sim, now + 10ms)); // interval
    assert(!guest.make_snapshot(sim, now + 40ms)); // not authoritative
    auto forced = guest.make_snapshot(sim, now + 40ms, true);
    assert(forced && forced->sync_state().frame() == 1);

    uint64_t last_frame = 1;
    auto t = now;
    bool saw_force = false;
    for (int i = 0; i < 120; ++i) {
        t += 20ms;
        auto s = host.make_snapshot(sim, t);
        assert(s);
        assert(s->sync_state().frame() == last_frame + 1);
        last_frame = s->sync_state().frame();
        if (s->sync_state().force_reset()) {
            assert(last_frame % 100 == 0);
            saw_force = true;
        }
    }
    assert(saw_force);

    // Paddle updates: on change after 16ms, otherwise a 500ms keepalive.
    auto p0 = host.make_paddle_update(100.f, now);
    assert(p0 && near(p0->paddle().paddle_y(), 100.f));
    assert(!host.make_paddle_update(110.f, now + 10ms));
    assert(host.make_paddle_update(110.f, now + 20ms));
    assert(!host.make_paddle_update(110.f, now + 400ms));
    assert(host.make_paddle_update(110.f, now + 520ms));
}

static void test_blend_on_guest()
{
    game::MatchConfig cfg;
    phys::Simulation sim(cfg, 5);
    game::BallSync guest(phys::Side::right, 2);
    auto &ball = sim.court().ball;
    ball.pos = {300.f, 200.f};
    ball.vel = {-4.f, 1.f};

    // Host is authoritative with the ball on its half; frame 50 is a regular one.
    auto snap = make_state(50, 310.f, 190.f, -5.f, 2.f);
    const b2Vec2 expected = b2Lerp(b2Vec2{300.f, 200.f}, b2Vec2{310.f, 190.f}, 0.6f);
    assert(guest.apply_snapshot(sim, snap) == game::ApplyOutcome::blended);
    assert(near(ball.pos.x, expected.x) && near(ball.pos.y, expected.y));
    assert(near(ball.pos.x, 306.f) && near(ball.pos.y, 194.f));
    assert(ball.vel.x == -5.f && ball.vel.y == 2.f);
    // Only the opponent's paddle follows the snapshot.
    assert(near(sim.court().left.y, 100.f));
    assert(near(sim.court().right.y, (cfg.height - sim.court().right.height) * 0.5f));

    // Applying the same snapshot again changes nothing.
    const b2Vec2 once = ball.pos;
    assert(guest.apply_snapshot(sim, snap) == game::ApplyOutcome::ignored_stale_frame);
    assert(ball.pos.x == once.x && ball.pos.y == once.y);
    assert(guest.last_applied_frame() == 50);

    // Far off: hard snap.
    auto far = make_state(51, 250.f, 100.f, -5.f, 2.f);
    assert(guest.apply_snapshot(sim, far) == game::ApplyOutcome::snapped);
    assert(ball.pos.x == 250.f && ball.pos.y == 100.f);
}

static void test_guards_and_rounds()
{
    game::MatchConfig cfg;
    cfg.rounds = 3;
    phys::Simulation sim(cfg, 5);
    sim.start();
    game::BallSync guest(phys::Side::right, 2);
    auto &ball = sim.court().ball;

    // Ball on the guest's own half: its local state wins.
    ball.pos = {600.f, 200.f};
    assert(guest.apply_snapshot(sim, make_state(10, 590.f, 200.f, 4.f, 0.f)) == game::ApplyOutcome::ignored_authoritative);
    assert(ball.pos.x == 600.f);

    // A newer round always lands, with the score.
    auto next = make_state(11, 400.f, 200.f, -4.f, 0.f, 1);
    next.set_left_score(1);
    assert(guest.apply_snapshot(sim, next) == game::ApplyOutcome::snapped);
    assert(sim.rounds_played() == 1 && sim.score(phys::Side::left) == 1);
    assert(ball.pos.x == 400.f);

    // Anything from before that round is stale.
    assert(guest.apply_snapshot(sim, make_state(12, 390.f, 200.f, -4.f, 0.f, 0)) == game::ApplyOutcome::ignored_stale_round);

    // Final round adopted through a snapshot halts the simulation.
    auto last = make_state(13, 400.f, 200.f, 0.f, 0.f, 3);
    last.set_left_score(2);
    last.set_right_score(1);
    guest.apply_snapshot(sim, last);
    assert(sim.halted());
}

static void test_forced_reset_overrides_authority()
{
    game::MatchConfig cfg;
    phys::Simulation sim(cfg, 6);
    sim.start();
    game::BallSync guest(phys::Side::right, 2);
    auto &ball = sim.court().ball;

    // The guest believes the ball is on its half; the host disagrees.
    ball.pos = {600.f, 200.f};
    assert(guest.has_authority(sim.court()));
    auto forced = make_state(100, 380.f, 210.f, -4.f, 1.f);
    forced.set_force_reset(true);
    assert(guest.apply_snapshot(sim, forced) == game::ApplyOutcome::snapped);
    assert(ball.pos.x == 380.f && ball.pos.y == 210.f);
    assert(near(ball.vel.x, -4.f) && near(ball.vel.y, 1.f));
    assert(guest.last_applied_frame() == 100);

    // The forced reset arms the convergence check.
    uint64_t frame = 100;
    for (int i = 0; i < 10; ++i) {
        ball.pos = {100.f, 200.f};
        guest.apply_snapshot(sim, make_state(++frame, 200.f, 200.f, 4.f, 0.f));
    }
    assert(guest.desynced());
}

static void test_desync_detection()
{
    game::MatchConfig cfg;
    phys::Simulation sim(cfg, 8);
    game::BallSync guest(phys::Side::right, 2);
    auto &ball = sim.court().ball;
    uint64_t frame = 100;
    ball.pos = {100.f, 200.f};
    auto forced = make_state(frame, 100.f, 200.f, 4.f, 0.f);
    forced.set_force_reset(true);
    assert(guest.apply_snapshot(sim, forced) == game::ApplyOutcome::snapped);
    assert(!guest.desynced());

    // Every snapshot disagrees by more than the snap threshold.
    for (int i = 0; i < 9; ++i) {
        ball.pos = {100.f, 200.f};
        guest.apply_snapshot(sim, make_state(++frame, 200.f, 200.f, 4.f, 0.f));
    }
    assert(!guest.desynced() && guest.consecutive_snaps() == 9);
    // A converging snapshot resets the streak.
    ball.pos = {200.f, 200.f};
    assert(guest.apply_snapshot(sim, make_state(++frame, 205.f, 200.f, 4.f, 0.f)) == game::ApplyOutcome::blended);
    assert(guest.consecutive_snaps() == 0);
    for (int i = 0; i < 10; ++i) {
        ball.pos = {100.f, 200.f};
        guest.apply_snapshot(sim, make_state(++frame, 200.f, 200.f, 4.f, 0.f));
    }
    assert(guest.desynced());
}

static void test_silence()
{
    game::BallSync s(phys::Side::left, 1);
    auto t0 = Clock::now();
    assert(!s.silent(t0 + 10s)); // nothing heard yet
    s.note_inbound(t0);
    assert(!s.silent(t0 + 2999ms));
    assert(s.silent(t0 + 3000ms));
}

int main()
{
    test_handshake();
    test_authority();
    test_snapshot_production();
    test_blend_on_guest();
    test_guards_and_rounds();
    test_forced_reset_overrides_authority();
    test_desync_detection();
    test_silence();
    std::cout << "unit_ball_sync OK" << std::endl;
    return 0;
}
