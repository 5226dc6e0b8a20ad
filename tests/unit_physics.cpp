// SPDX-License-Identifier: Apache-2.0
#include "game/physics.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace pong;

static bool near(float a, float b, float eps = 1e-3f)
{
    return std::fabs(a - b) <= eps;
}

static void test_court_geometry()
{
    game::MatchConfig cfg; // 800x400 windowed
    auto c = phys::make_court(cfg);
    assert(near(c.speed_scale, 1.f));
    assert(near(c.left.width, 16.f) && near(c.left.height, 80.f));
    assert(near(c.left.x, 32.f));
    assert(near(c.right.x, 800.f - 48.f));
    assert(near(c.left.face_x(), 48.f) && near(c.right.face_x(), 752.f));
    assert(near(c.ball.radius, 5.f));
    assert(near(c.ball.pos.x, 400.f) && near(c.ball.pos.y, 200.f));

    // Small windows scale speeds down, never below 0.3.
    assert(near(phys::speed_scale_for(400.f, 300.f, false), 0.5f));
    assert(near(phys::speed_scale_for(100.f, 100.f, false), 0.3f));
    assert(near(phys::speed_scale_for(1920.f, 1080.f, true), 1.5f));
}

static void test_paddle_bounds()
{
    game::MatchConfig cfg;
    auto c = phys::make_court(cfg);
    phys::set_paddle_top(c.left, -50.f, c.height);
    assert(near(c.left.y, 0.f));
    phys::set_paddle_top(c.left, 1000.f, c.height);
    assert(near(c.left.y, c.height - c.left.height));

    // Steering is rate limited and stops inside the tolerance.
    phys::set_paddle_top(c.right, 0.f, c.height);
    bool moved = phys::steer_paddle(c.right, 300.f, 4.5f, 10.f, c.height);
    assert(moved && near(c.right.y, 4.5f));
    phys::set_paddle_top(c.right, 160.f, c.height); // centre 200
    assert(!phys::steer_paddle(c.right, 205.f, 4.5f, 10.f, c.height));
}

static void test_serve()
{
    game::MatchConfig cfg;
    auto c = phys::make_court(cfg);
    std::mt19937 rng(7);
    for (int i = 0; i < 50; ++i) {
        phys::serve(c, phys::Side::right, rng);
        assert(c.ball.vel.x > 0.f);
        assert(near(std::hypot(c.ball.vel.x, c.ball.vel.y), c.serve_speed));
        float angle = std::atan2(std::fabs(c.ball.vel.y), c.ball.vel.x);
        assert(angle <= phys::kServeHalfAngle + 1e-4f);
        phys::serve(c, phys::Side::left, rng);
        assert(c.ball.vel.x < 0.f);
        assert(near(c.ball.pos.x, 400.f) && near(c.ball.pos.y, 200.f));
    }
}

static void test_paddle_and_wall_collisions()
{
    game::MatchConfig cfg;
    auto c = phys::make_court(cfg);
    std::mt19937 rng(1);

    // Dead centre of the left paddle: straight back out, one increment faster.
    c.ball.pos = {52.f, 200.f};
    c.ball.vel = {-4.f, 0.f};
    c.ball.speed = 4.f;
    auto r = phys::advance(c, cfg, 1.f, rng);
    assert(r.paddle_hit && *r.paddle_hit == phys::Side::left);
    assert(near(c.ball.speed, 4.5f));
    assert(near(c.ball.vel.x, 4.5f) && near(c.ball.vel.y, 0.f));
    assert(near(c.ball.pos.x, 53.f));

    // Top wall: vertical velocity flips and the ball is pushed back inside.
    c.ball.pos = {400.f, 6.f};
    c.ball.vel = {0.f, -4.f};
    r = phys::advance(c, cfg, 1.f, rng);
    assert(r.wall_bounce);
    assert(near(c.ball.vel.y, 4.f) && near(c.ball.pos.y, c.ball.radius));

    // Leaving on the right is reported, not scored.
    c.ball.pos = {798.f, 50.f};
    c.ball.vel = {4.f, 0.f};
    r = phys::advance(c, cfg, 1.f, rng);
    assert(r.exited && *r.exited == phys::Side::right);
}

static void test_simulation_properties()
{
    game::MatchConfig cfg;
    cfg.rounds = 5;
    cfg.random_bounce = true;
    cfg.gravity = true;
    phys::Simulation sim(cfg, 1234);
    sim.start();
    assert(sim.started());

    uint32_t rounds_seen = 0;
    float round_speed = sim.court().ball.speed;
    bool over = false;
    for (int i = 0; i < 200000 && !over; ++i) {
        // Keep one paddle tracking the ball so rallies include hits.
        auto &court = sim.court();
        phys::steer_paddle(court.left, court.ball.pos.y, court.paddle_speed, 2.f, court.height);
        auto rep = sim.tick(1.f);
        const auto &b = sim.court().ball;
        for (auto s : {phys::Side::left, phys::Side::right}) {
            const auto &p = sim.court().paddle(s);
            assert(p.y >= 0.f && p.y <= sim.court().height - p.height);
        }
        if (rep.round_completed) {
            ++rounds_seen;
            assert(sim.rounds_played() == rounds_seen);
            round_speed = b.speed;
        } else {
            assert(b.speed >= round_speed);
            round_speed = b.speed;
        }
        if (!rep.game_over) {
            assert(b.pos.x >= 0.f && b.pos.x <= sim.court().width);
            assert(b.pos.y >= 0.f && b.pos.y <= sim.court().height);
        }
        over = rep.game_over;
    }
    assert(over);
    assert(sim.rounds_played() == cfg.rounds);
    assert(sim.score(phys::Side::left) + sim.score(phys::Side::right) == cfg.rounds);
    assert(sim.halted());
    // Halted simulations ignore further ticks.
    auto after = sim.tick(1.f);
    assert(!after.round_completed && sim.rounds_played() == cfg.rounds);
}

static void test_deferred_exit_and_adopt()
{
    game::MatchConfig cfg;
    cfg.rounds = 3;
    phys::Simulation sim(cfg, 99);
    sim.start();
    auto &b = sim.court().ball;
    b.pos = {2.f, 300.f};
    b.vel = {-4.f, 0.f};
    auto rep = sim.tick(1.f, false);
    assert(rep.exit_deferred && !rep.round_completed);
    assert(sim.rounds_played() == 0);
    assert(near(sim.court().ball.pos.x, 0.f));

    assert(sim.adopt_round(2, 0, 2) == 2);
    assert(sim.rounds_played() == 2 && sim.score(phys::Side::right) == 2);
    assert(sim.last_scorer() && *sim.last_scorer() == phys::Side::right);
    assert(!sim.halted());
    assert(sim.adopt_round(1, 0, 1) == 0); // older rounds never rewind
    assert(sim.adopt_round(3, 1, 2) == 1);
    assert(sim.halted());
}

int main()
{
    test_court_geometry();
    test_paddle_bounds();
    test_serve();
    test_paddle_and_wall_collisions();
    test_simulation_properties();
    test_deferred_exit_and_adopt();
    std::cout << "unit_physics OK" << std::endl;
    return 0;
}
