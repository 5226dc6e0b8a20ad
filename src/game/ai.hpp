// SPDX-License-Identifier: Apache-2.0
// ai.hpp - computer opponent. Re-plans at most once per decision interval to
// imitate human reaction time and steers toward the cached target every tick.
#pragma once
#include "game/physics.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>

namespace pong::game {

struct AiTuning
{
    std::chrono::milliseconds decision_interval{1000};
    float dead_zone{20.f}; // hold still when this close to centre while the ball recedes
    float tolerance{10.f}; // no movement when the paddle centre is this close to the target
    float min_vx{0.1f}; // below this horizontal speed no prediction is made
    float error_scale{0.8f}; // fraction of paddle height used for aim error
    float miss_difficulty{0.8f}; // above this difficulty deliberate misses kick in
    float miss_chance{0.1f};
};

// Folds an unbounded y back into [0, height] as if reflected by both walls.
float reflect_into_court(float y, float height);

// Ball y when it reaches face_x assuming straight flight with wall
// reflections; nullopt when the ball is not approaching.
std::optional<float> predict_impact_y(const phys::Ball &ball, float face_x, float height, float min_vx);

class AiController
{
public:
    using Clock = std::chrono::steady_clock;

    AiController(phys::Side side, float difficulty, uint64_t seed, AiTuning tuning = {});

    // Target centre y for the controlled paddle given the current court.
    float compute_target(const phys::Court &court);

    // Re-plans when the decision interval elapsed (or on first call).
    bool maybe_decide(phys::Court &court, Clock::time_point now);

    // Moves the paddle toward the cached target, rate limited by paddle speed.
    bool drive(phys::Court &court, float dt);

    void update(phys::Court &court, float dt, Clock::time_point now)
    {
        maybe_decide(court, now);
        drive(court, dt);
    }

    phys::Side side() const { return m_side; }
    float difficulty() const { return m_difficulty; }
    std::optional<float> target() const { return m_target; }
    uint64_t decisions() const { return m_decisions; }

private:
    phys::Side m_side;
    float m_difficulty;
    AiTuning m_tuning;
    std::mt19937 m_rng;
    std::optional<float> m_target;
    std::optional<Clock::time_point> m_last_decision;
    uint64_t m_decisions{0};
};

} // namespace pong::game
