// SPDX-License-Identifier: Apache-2.0
// physics.hpp - ball and paddle kinematics, wall/paddle collisions and round
// scoring for one court. Units are surface pixels; dt is a frame factor
// (1.0 == one 60 Hz frame).
#pragma once
#include "game/match_config.hpp"

#include <box2d/box2d.h>

#include <cstdint>
#include <optional>
#include <random>

namespace pong::phys {

enum class Side : uint8_t
{
    left,
    right
};

inline Side opposite(Side s)
{
    return s == Side::left ? Side::right : Side::left;
}

inline const char *to_string(Side s)
{
    return s == Side::left ? "left" : "right";
}

inline constexpr float kMaxDt = 3.f;
inline constexpr float kMaxDeflection = 0.42f * 3.14159265f; // ~75 degrees
inline constexpr float kServeHalfAngle = 3.14159265f / 8.f; // 22.5 degrees
inline constexpr float kBouncePerturbation = 0.3f;
inline constexpr float kMinVerticalAfterBounce = 0.2f;
inline constexpr float kMinHorizontalAfterHit = 0.5f;
inline constexpr float kBasePaddleSpeed = 4.5f;

struct Ball
{
    b2Vec2 pos{0.f, 0.f};
    b2Vec2 vel{0.f, 0.f};
    float radius{5.f};
    float speed{0.f};
};

struct Paddle
{
    Side side{Side::left};
    float x{0.f};
    float y{0.f}; // top edge
    float width{10.f};
    float height{80.f};
    float target_y{0.f}; // centre the AI is steering toward

    float center_y() const { return y + height * 0.5f; }
    // x of the face the ball strikes
    float face_x() const { return side == Side::left ? x + width : x; }
};

struct Court
{
    float width{800.f};
    float height{400.f};
    float speed_scale{1.f};
    float paddle_speed{kBasePaddleSpeed};
    float serve_speed{4.f}; // initial ball speed after scaling
    float speed_increment{0.5f}; // after scaling
    Ball ball;
    Paddle left;
    Paddle right;

    float center_x() const { return width * 0.5f; }
    Paddle &paddle(Side s) { return s == Side::left ? left : right; }
    const Paddle &paddle(Side s) const { return s == Side::left ? left : right; }
};

// Fullscreen: max(w, h) / 1000, windowed: w / 800; clamped to [0.3, 1.5].
float speed_scale_for(float width, float height, bool fullscreen);

// Builds paddles and ball geometry for the configured surface; the ball is
// parked at the centre with zero velocity until the first serve.
Court make_court(const game::MatchConfig &cfg);

void clamp_paddle(Paddle &p, float surface_height);
void set_paddle_top(Paddle &p, float top, float surface_height);

// Moves the paddle centre toward target_center by at most paddle_speed * dt.
// Returns true when the paddle moved.
bool steer_paddle(Paddle &p, float target_center, float max_step, float tolerance, float surface_height);

// Centres the ball, resets speed and launches within +-22.5 degrees toward
// the given side.
void serve(Court &court, Side toward, std::mt19937 &rng);

struct StepResult
{
    bool wall_bounce{false};
    std::optional<Side> paddle_hit;
    std::optional<Side> exited; // edge the ball crossed
};

// Advances one tick: integrate, gravity, wall bounce, paddle collision, exit
// detection. Does not serve or score; see Simulation.
StepResult advance(Court &court, const game::MatchConfig &cfg, float dt, std::mt19937 &rng);

// Owns a court plus the round/score bookkeeping of one match.
class Simulation
{
public:
    struct TickReport
    {
        StepResult step;
        bool round_completed{false};
        std::optional<Side> scorer;
        bool game_over{false};
        bool exit_deferred{false}; // ball left the court but scoring belongs to the peer
    };

    Simulation(game::MatchConfig cfg, uint64_t seed);

    // First serve. With random serve policy the side is drawn from the rng.
    void start();
    // With may_score false an exit only parks the ball on the edge; the round
    // is counted once the authoritative peer reports it (adopt_round).
    TickReport tick(float dt, bool may_score = true);

    // Fast-forwards bookkeeping to a peer's newer round. The ball is left for
    // the accompanying snapshot to overwrite. Returns the rounds skipped.
    uint32_t adopt_round(uint32_t rounds_played, uint32_t left_score, uint32_t right_score);

    // Stops stepping; further ticks are no-ops.
    void halt() { m_halted = true; }

    const game::MatchConfig &config() const { return m_cfg; }
    Court &court() { return m_court; }
    const Court &court() const { return m_court; }
    uint32_t rounds_played() const { return m_rounds_played; }
    uint32_t score(Side s) const { return s == Side::left ? m_left_score : m_right_score; }
    bool halted() const { return m_halted; }
    bool started() const { return m_started; }
    std::optional<Side> last_scorer() const { return m_last_scorer; }

private:
    Side pick_serve_side(std::optional<Side> conceder);

    game::MatchConfig m_cfg;
    Court m_court;
    std::mt19937 m_rng;
    uint32_t m_rounds_played{0};
    uint32_t m_left_score{0};
    uint32_t m_right_score{0};
    bool m_halted{false};
    bool m_started{false};
    std::optional<Side> m_last_scorer;
};

} // namespace pong::phys
