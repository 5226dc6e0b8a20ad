// SPDX-License-Identifier: Apache-2.0
#include "game/ai.hpp"

#include "common/log_rate_limit.hpp"

#include <algorithm>
#include <cmath>

namespace pong::game {

float reflect_into_court(float y, float height)
{
    if (height <= 0.f)
        return 0.f;
    const float period = 2.f * height;
    float m = std::fmod(y, period);
    if (m < 0.f)
        m += period;
    return m > height ? period - m : m;
}

std::optional<float> predict_impact_y(const phys::Ball &ball, float face_x, float height, float min_vx)
{
    if (std::fabs(ball.vel.x) < min_vx)
        return std::nullopt;
    float t = (face_x - ball.pos.x) / ball.vel.x;
    if (t <= 0.f)
        return std::nullopt;
    return reflect_into_court(ball.pos.y + ball.vel.y * t, height);
}

AiController::AiController(phys::Side side, float difficulty, uint64_t seed, AiTuning tuning)
    : m_side(side), m_difficulty(std::clamp(difficulty, 0.f, 1.f)), m_tuning(tuning),
      m_rng(static_cast<std::mt19937::result_type>(seed * 2654435761u + 97u))
{}

float AiController::compute_target(const phys::Court &court)
{
    const phys::Paddle &p = court.paddle(m_side);
    const phys::Ball &b = court.ball;
    const float mid = court.height * 0.5f;
    const bool approaching = m_side == phys::Side::right ? b.vel.x > 0.f : b.vel.x < 0.f;

    if (!approaching) {
        if (std::fabs(p.center_y() - mid) <= m_tuning.dead_zone)
            return p.center_y();
        return mid;
    }

    auto impact = predict_impact_y(b, p.face_x(), court.height, m_tuning.min_vx);
    if (!impact)
        return m_target.value_or(p.center_y());

    std::uniform_real_distribution<float> half(-0.5f, 0.5f);
    float target = *impact + (1.f - m_difficulty) * p.height * m_tuning.error_scale * half(m_rng);
    if (m_difficulty > m_tuning.miss_difficulty) {
        std::bernoulli_distribution miss(m_tuning.miss_chance);
        if (miss(m_rng)) {
            std::bernoulli_distribution up(0.5);
            target += (up(m_rng) ? -0.8f : 0.8f) * p.height;
        }
    }
    const float lo = p.height * 0.5f;
    const float hi = std::max(lo, court.height - p.height * 0.5f);
    return std::clamp(target, lo, hi);
}

bool AiController::maybe_decide(phys::Court &court, Clock::time_point now)
{
    if (m_last_decision && now - *m_last_decision < m_tuning.decision_interval)
        return false;
    m_last_decision = now;
    m_target = compute_target(court);
    court.paddle(m_side).target_y = *m_target;
    ++m_decisions;
    PONG_LOG_EVERY_N(trace, 10, "[ai] side={} target={} ball=({}, {})", phys::to_string(m_side), *m_target,
        court.ball.pos.x, court.ball.pos.y);
    return true;
}

bool AiController::drive(phys::Court &court, float dt)
{
    if (!m_target)
        return false;
    dt = std::clamp(dt, 0.f, phys::kMaxDt);
    return phys::steer_paddle(court.paddle(m_side), *m_target, court.paddle_speed * dt, m_tuning.tolerance,
        court.height);
}

} // namespace pong::game
