// SPDX-License-Identifier: Apache-2.0
// match_session.hpp - lifecycle of one match as seen by a peer. Owns the
// simulation, the AI and (in multiplayer) the reconciliation state; the caller
// feeds relay messages in, drives tick() at a fixed rate and drains the
// outbox and the event channel.
#pragma once
#include "game/ai.hpp"
#include "game/ball_sync.hpp"
#include "game/match_config.hpp"
#include "game/physics.hpp"

#include "pong.pb.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pong::game {

enum class SessionState : uint8_t
{
    idle,
    queued,
    active,
    round_complete,
    finished
};

enum class EndReason : uint8_t
{
    target_reached,
    peer_game_over,
    forfeit,
    connection_lost,
    desync,
    abandoned
};

const char *to_string(SessionState s);
const char *to_string(EndReason r);

struct MatchResult
{
    uint32_t rounds_played{0};
    uint32_t target_rounds{0};
    bool is_multiplayer{false};
    bool is_tournament{false};
    EndReason reason{EndReason::abandoned};
    uint32_t left_score{0};
    uint32_t right_score{0};
    phys::Side local_side{phys::Side::left};
    std::optional<phys::Side> last_scorer;

    uint32_t local_score() const { return local_side == phys::Side::left ? left_score : right_score; }
    // Higher score wins; a level score goes to whoever scored last.
    std::optional<phys::Side> winner() const;
};

struct RoundCompleted
{
    uint32_t rounds_played{0};
    phys::Side scorer{phys::Side::left};
    uint32_t left_score{0};
    uint32_t right_score{0};
};

struct ReconnectRequested
{
    std::string room;
    phys::Side side{phys::Side::left};
};

struct MatchFinished
{
    MatchResult result;
};

using SessionEvent = std::variant<RoundCompleted, ReconnectRequested, MatchFinished>;

struct PlayerIdentity
{
    std::string nickname;
    std::string token;
};

class MatchSession
{
public:
    using Clock = std::chrono::steady_clock;

    MatchSession(MatchConfig base, PlayerIdentity who, uint64_t session_id);
    ~MatchSession();

    MatchSession(const MatchSession &) = delete;
    MatchSession &operator=(const MatchSession &) = delete;

    // Idle -> Queued; queues a join for the relay. False in any other state.
    bool enqueue();
    // Queued -> Idle; queues leave_queue.
    bool leave_queue();
    // Idle -> Active against the AI on the right paddle.
    void start_single_player(Clock::time_point now);

    // Lets an AI drive the local paddle (headless peers, demo mode).
    void enable_autopilot(float difficulty);

    // Buffered; applied at the start of the next tick.
    void on_message(pong::ServerMessage msg);
    void tick(Clock::time_point now, float dt);

    // Local paddle top from player input; ignored while autopilot is on.
    void set_local_paddle(float top);

    // Outcome of the reconnect asked for through ReconnectRequested.
    void report_reconnect(bool ok, Clock::time_point now);

    // Halts immediately; the caller flushes the outbox afterwards.
    void abandon();

    std::vector<pong::ClientMessage> drain_outbox();
    std::vector<SessionEvent> drain_events();

    SessionState state() const { return m_state; }
    bool is_multiplayer() const { return m_multiplayer; }
    bool is_tournament() const { return m_tournament; }
    phys::Side local_side() const { return m_sync ? m_sync->local_side() : m_local_side; }
    uint64_t id() const { return m_id; }
    const std::string &room() const { return m_room; }
    const std::string &opponent() const { return m_opponent; }
    const std::string &tournament_id() const { return m_tournament_id; }
    const std::string &match_id() const { return m_match_id; }
    uint32_t queue_position() const { return m_queue_position; }
    const MatchConfig &base_config() const { return m_base; }
    const phys::Simulation *simulation() const { return m_sim.get(); }
    const BallSync *sync() const { return m_sync.get(); }
    const std::optional<MatchResult> &result() const { return m_result; }
    const std::string &last_error() const { return m_last_error; }

private:
    void apply(const pong::ServerMessage &msg, Clock::time_point now);
    void activate_multiplayer(const pong::StartGame &sg, Clock::time_point now);
    void apply_game_update(const pong::GameUpdate &upd, Clock::time_point now);
    void emit_adopted_rounds(uint32_t rounds_before, uint32_t left_before, uint32_t right_before);
    void push_round_event(const RoundCompleted &ev);
    void step(Clock::time_point now, float dt);
    void check_liveness(Clock::time_point now);
    void finish(EndReason reason, bool notify_relay);
    void push_game_update(pong::GameUpdate upd);

    MatchConfig m_base;
    PlayerIdentity m_who;
    uint64_t m_id;
    SessionState m_state{SessionState::idle};
    bool m_multiplayer{false};
    bool m_tournament{false};
    phys::Side m_local_side{phys::Side::left};
    std::string m_room;
    std::string m_opponent;
    std::string m_tournament_id;
    std::string m_match_id;
    uint32_t m_queue_position{0};
    std::string m_last_error;

    std::unique_ptr<phys::Simulation> m_sim;
    std::unique_ptr<AiController> m_opponent_ai; // single player only
    std::unique_ptr<AiController> m_autopilot;
    std::optional<float> m_autopilot_difficulty;
    std::unique_ptr<BallSync> m_sync;
    bool m_reconnect_requested{false};
    std::optional<Clock::time_point> m_deferred_since;
    bool m_round_adopted{false};

    std::vector<pong::ServerMessage> m_inbox;
    std::vector<pong::ClientMessage> m_outbox;
    std::vector<SessionEvent> m_events;
    std::optional<MatchResult> m_result;
};

} // namespace pong::game
