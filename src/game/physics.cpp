// SPDX-License-Identifier: Apache-2.0
#include "game/physics.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace pong::phys {

float speed_scale_for(float width, float height, bool fullscreen)
{
    float scale = fullscreen ? std::max(width, height) / 1000.f : width / 800.f;
    return std::clamp(scale, 0.3f, 1.5f);
}

Court make_court(const game::MatchConfig &cfg)
{
    Court c;
    c.width = cfg.width;
    c.height = cfg.height;
    c.speed_scale = speed_scale_for(cfg.width, cfg.height, cfg.fullscreen);
    c.paddle_speed = cfg.paddle_speed * c.speed_scale;
    c.serve_speed = cfg.initial_ball_speed * c.speed_scale;
    c.speed_increment = cfg.speed_increment * c.speed_scale;

    const float pw = std::max(10.f, std::floor(cfg.width * 0.02f));
    const float base_h = std::max(60.f, std::floor(cfg.height * 0.2f));
    const float ph = std::min(base_h * cfg.paddle_size_multiplier, cfg.height);
    for (Side s : {Side::left, Side::right}) {
        Paddle &p = c.paddle(s);
        p.side = s;
        p.width = pw;
        p.height = ph;
        p.x = s == Side::left ? pw * 2.f : cfg.width - pw * 3.f;
        p.y = (cfg.height - ph) * 0.5f;
        p.target_y = cfg.height * 0.5f;
    }
    c.ball.radius = std::max(5.f, std::floor(std::min(cfg.width, cfg.height) * 0.01f));
    c.ball.pos = {cfg.width * 0.5f, cfg.height * 0.5f};
    c.ball.vel = b2Vec2{0.f, 0.f};
    c.ball.speed = c.serve_speed;
    return c;
}

void clamp_paddle(Paddle &p, float surface_height)
{
    p.y = std::clamp(p.y, 0.f, std::max(0.f, surface_height - p.height));
}

void set_paddle_top(Paddle &p, float top, float surface_height)
{
    p.y = top;
    clamp_paddle(p, surface_height);
}

bool steer_paddle(Paddle &p, float target_center, float max_step, float tolerance, float surface_height)
{
    float diff = target_center - p.center_y();
    if (std::fabs(diff) <= tolerance)
        return false;
    float before = p.y;
    p.y += std::clamp(diff, -max_step, max_step);
    clamp_paddle(p, surface_height);
    return p.y != before;
}

void serve(Court &court, Side toward, std::mt19937 &rng)
{
    std::uniform_real_distribution<float> angle_dist(-kServeHalfAngle, kServeHalfAngle);
    float angle = angle_dist(rng);
    float dir = toward == Side::right ? 1.f : -1.f;
    Ball &b = court.ball;
    b.pos = {court.width * 0.5f, court.height * 0.5f};
    b.speed = court.serve_speed;
    b.vel = {b.speed * std::cos(angle) * dir, b.speed * std::sin(angle)};
}

namespace {

bool overlaps(const Ball &b, const Paddle &p)
{
    return b.pos.x - b.radius < p.x + p.width && b.pos.x + b.radius > p.x && b.pos.y > p.y
        && b.pos.y < p.y + p.height;
}

void deflect(Court &court, const Paddle &p)
{
    Ball &b = court.ball;
    float half = p.height * 0.5f;
    float offset = std::clamp((b.pos.y - (p.y + half)) / half, -1.f, 1.f);
    float angle = offset * kMaxDeflection;
    b.speed += court.speed_increment;
    float dir = p.side == Side::left ? 1.f : -1.f;
    b.vel.x = dir * std::fabs(b.speed * std::cos(angle));
    b.vel.y = b.speed * std::sin(angle);
    float min_h = b.speed * kMinHorizontalAfterHit;
    if (std::fabs(b.vel.x) < min_h)
        b.vel.x = dir * min_h;
    b.pos.x = p.side == Side::left ? p.x + p.width + b.radius : p.x - b.radius;
}

} // namespace

StepResult advance(Court &court, const game::MatchConfig &cfg, float dt, std::mt19937 &rng)
{
    StepResult res;
    dt = std::clamp(dt, 0.f, kMaxDt);
    Ball &b = court.ball;

    b.pos = b2MulAdd(b.pos, dt, b.vel);
    if (cfg.gravity)
        b.vel.y += cfg.gravity_strength * dt;

    const bool hit_top = b.pos.y - b.radius < 0.f;
    const bool hit_bottom = b.pos.y + b.radius > court.height;
    if (hit_top || hit_bottom) {
        res.wall_bounce = true;
        b.vel.y = -b.vel.y;
        if (cfg.random_bounce) {
            std::uniform_real_distribution<float> jitter(-1.f, 1.f);
            b.vel.y += jitter(rng) * b.speed * kBouncePerturbation;
            // y grows downward: leaving the top wall means positive vy
            float away = hit_top ? 1.f : -1.f;
            b.vel.y = away * std::max(std::fabs(b.vel.y), b.speed * kMinVerticalAfterBounce);
        }
        b.pos.y = hit_top ? b.radius : court.height - b.radius;
    }

    if (b.vel.x < 0.f && overlaps(b, court.left)) {
        deflect(court, court.left);
        res.paddle_hit = Side::left;
    } else if (b.vel.x > 0.f && overlaps(b, court.right)) {
        deflect(court, court.right);
        res.paddle_hit = Side::right;
    }

    if (b.pos.x < 0.f)
        res.exited = Side::left;
    else if (b.pos.x > court.width)
        res.exited = Side::right;
    return res;
}

Simulation::Simulation(game::MatchConfig cfg, uint64_t seed)
    : m_cfg(std::move(cfg)), m_rng(static_cast<std::mt19937::result_type>(seed ^ (seed >> 32)))
{
    m_cfg.validate();
    m_court = make_court(m_cfg);
}

Side Simulation::pick_serve_side(std::optional<Side> conceder)
{
    if (m_cfg.serve == game::ServePolicy::toward_conceder && conceder)
        return *conceder;
    std::bernoulli_distribution coin(0.5);
    return coin(m_rng) ? Side::right : Side::left;
}

void Simulation::start()
{
    if (m_started)
        return;
    m_started = true;
    serve(m_court, pick_serve_side(std::nullopt), m_rng);
}

Simulation::TickReport Simulation::tick(float dt, bool may_score)
{
    TickReport rep;
    if (m_halted || !m_started)
        return rep;
    rep.step = advance(m_court, m_cfg, dt, m_rng);
    if (!rep.step.exited)
        return rep;

    if (!may_score) {
        Ball &b = m_court.ball;
        b.pos.x = std::clamp(b.pos.x, 0.f, m_court.width);
        rep.exit_deferred = true;
        return rep;
    }

    const Side conceder = *rep.step.exited;
    const Side scorer = opposite(conceder);
    ++m_rounds_played;
    if (scorer == Side::left)
        ++m_left_score;
    else
        ++m_right_score;
    m_last_scorer = scorer;
    rep.round_completed = true;
    rep.scorer = scorer;
    if (m_rounds_played >= m_cfg.rounds) {
        rep.game_over = true;
        m_halted = true;
        return rep;
    }
    serve(m_court, pick_serve_side(conceder), m_rng);
    return rep;
}

uint32_t Simulation::adopt_round(uint32_t rounds_played, uint32_t left_score, uint32_t right_score)
{
    if (rounds_played <= m_rounds_played)
        return 0;
    uint32_t skipped = rounds_played - m_rounds_played;
    if (left_score > m_left_score)
        m_last_scorer = Side::left;
    else if (right_score > m_right_score)
        m_last_scorer = Side::right;
    m_rounds_played = rounds_played;
    m_left_score = left_score;
    m_right_score = right_score;
    if (m_rounds_played >= m_cfg.rounds)
        m_halted = true;
    return skipped;
}

} // namespace pong::phys
