// SPDX-License-Identifier: Apache-2.0
#include "game/match_session.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>
#include <utility>

namespace pong::game {

namespace {

// splitmix64 finaliser; spreads session ids into handshake nonces.
uint64_t mix(uint64_t x)
{
    x += 0x9e3779b97f4a7c15ull;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
    return x ^ (x >> 31);
}

} // namespace

const char *to_string(SessionState s)
{
    switch (s) {
        case SessionState::idle:
            return "idle";
        case SessionState::queued:
            return "queued";
        case SessionState::active:
            return "active";
        case SessionState::round_complete:
            return "round_complete";
        case SessionState::finished:
            return "finished";
    }
    return "unknown";
}

const char *to_string(EndReason r)
{
    switch (r) {
        case EndReason::target_reached:
            return "target_reached";
        case EndReason::peer_game_over:
            return "peer_game_over";
        case EndReason::forfeit:
            return "forfeit";
        case EndReason::connection_lost:
            return "connection_lost";
        case EndReason::desync:
            return "desync";
        case EndReason::abandoned:
            return "abandoned";
    }
    return "unknown";
}

std::optional<phys::Side> MatchResult::winner() const
{
    if (left_score > right_score)
        return phys::Side::left;
    if (right_score > left_score)
        return phys::Side::right;
    return last_scorer;
}

MatchSession::MatchSession(MatchConfig base, PlayerIdentity who, uint64_t session_id)
    : m_base(std::move(base)), m_who(std::move(who)), m_id(session_id)
{
    m_base.validate();
}

MatchSession::~MatchSession()
{
    if (m_state == SessionState::active || m_state == SessionState::round_complete)
        metrics::gauge_dec(metrics::match().active_sessions);
}

bool MatchSession::enqueue()
{
    if (m_state != SessionState::idle)
        return false;
    pong::ClientMessage msg;
    auto *join = msg.mutable_join();
    join->set_nickname(m_who.nickname);
    join->set_token(m_who.token);
    join->set_rounds(m_base.rounds);
    m_outbox.push_back(std::move(msg));
    m_state = SessionState::queued;
    log::info("[session {}] queued as {} for {} rounds", m_id, m_who.nickname, m_base.rounds);
    return true;
}

bool MatchSession::leave_queue()
{
    if (m_state != SessionState::queued)
        return false;
    pong::ClientMessage msg;
    msg.mutable_leave_queue();
    m_outbox.push_back(std::move(msg));
    m_state = SessionState::idle;
    return true;
}

void MatchSession::start_single_player(Clock::time_point now)
{
    if (m_state != SessionState::idle)
        return;
    const uint64_t seed = m_base.seed ? m_base.seed : mix(m_id);
    m_sim = std::make_unique<phys::Simulation>(m_base, seed);
    m_multiplayer = false;
    m_local_side = phys::Side::left;
    m_opponent = "AI";
    m_opponent_ai = std::make_unique<AiController>(phys::Side::right, m_base.ai_difficulty, seed + 1);
    if (m_autopilot_difficulty)
        m_autopilot = std::make_unique<AiController>(m_local_side, *m_autopilot_difficulty, seed + 2);
    m_sim->start();
    m_opponent_ai->maybe_decide(m_sim->court(), now);
    m_state = SessionState::active;
    metrics::match().active_sessions.fetch_add(1, std::memory_order_relaxed);
    log::info("[session {}] single player vs AI difficulty={} rounds={}", m_id, m_base.ai_difficulty, m_base.rounds);
}

void MatchSession::enable_autopilot(float difficulty)
{
    m_autopilot_difficulty = difficulty;
    if (m_sim && !m_autopilot)
        m_autopilot = std::make_unique<AiController>(local_side(), difficulty, mix(m_id) + 2);
}

void MatchSession::on_message(pong::ServerMessage msg)
{
    m_inbox.push_back(std::move(msg));
}

void MatchSession::set_local_paddle(float top)
{
    if (!m_sim || m_autopilot)
        return;
    phys::Court &c = m_sim->court();
    phys::set_paddle_top(c.paddle(local_side()), top, c.height);
}

void MatchSession::activate_multiplayer(const pong::StartGame &sg, Clock::time_point now)
{
    MatchConfig cfg = m_base;
    if (sg.rounds() > 0)
        cfg.rounds = sg.rounds();
    const uint64_t seed = sg.seed() ? sg.seed() : (cfg.seed ? cfg.seed : mix(m_id));
    cfg.seed = seed;
    m_sim = std::make_unique<phys::Simulation>(cfg, seed);
    m_multiplayer = true;
    m_tournament = sg.is_tournament();
    m_tournament_id = sg.tournament_id();
    m_match_id = sg.match_id();
    m_room = sg.room();
    m_opponent = sg.opponent();
    m_local_side = from_wire(sg.player_side());
    m_sync = std::make_unique<BallSync>(m_local_side, mix(m_id ^ seed));
    m_sync->note_inbound(now);
    m_opponent_ai.reset();
    if (m_autopilot_difficulty)
        m_autopilot = std::make_unique<AiController>(m_local_side, *m_autopilot_difficulty, seed + 2);
    m_state = SessionState::active;
    metrics::match().active_sessions.fetch_add(1, std::memory_order_relaxed);
    log::info("[session {}] start room={} side={} opponent={} rounds={} tournament={}", m_id, m_room,
        phys::to_string(m_local_side), m_opponent, cfg.rounds, m_tournament);
}

void MatchSession::apply_game_update(const pong::GameUpdate &upd, Clock::time_point now)
{
    if (!m_sync || !m_sim)
        return;
    m_sync->note_inbound(now);
    switch (upd.payload_case()) {
        case pong::GameUpdate::kPaddle:
            m_sync->apply_paddle(*m_sim, upd.paddle());
            break;
        case pong::GameUpdate::kSyncState:
        {
            if (!m_sim->started())
                m_sim->start();
            const uint32_t rounds_before = m_sim->rounds_played();
            const uint32_t left_before = m_sim->score(phys::Side::left);
            const uint32_t right_before = m_sim->score(phys::Side::right);
            m_sync->apply_snapshot(*m_sim, upd.sync_state());
            if (m_sim->rounds_played() > rounds_before)
                emit_adopted_rounds(rounds_before, left_before, right_before);
            break;
        }
        case pong::GameUpdate::kHostAnnounce:
            m_sync->on_announce(upd.host_announce());
            break;
        case pong::GameUpdate::PAYLOAD_NOT_SET:
            break;
    }
}

// Rounds counted by the peer reach us as a jump in rounds_played. Each one is
// reported like a locally scored round; the snapshot only carries the final
// score, so the last round goes to the recorded last scorer and the earlier
// ones are spread over the remaining score delta.
void MatchSession::emit_adopted_rounds(uint32_t rounds_before, uint32_t left_before, uint32_t right_before)
{
    const uint32_t rounds_after = m_sim->rounds_played();
    const uint32_t left_after = m_sim->score(phys::Side::left);
    const uint32_t right_after = m_sim->score(phys::Side::right);
    uint32_t left_gain = left_after > left_before ? left_after - left_before : 0;
    uint32_t right_gain = right_after > right_before ? right_after - right_before : 0;

    const phys::Side last = m_sim->last_scorer().value_or(left_gain ? phys::Side::left : phys::Side::right);
    std::vector<phys::Side> scorers(rounds_after - rounds_before, last);
    if (last == phys::Side::left && left_gain)
        --left_gain;
    else if (last == phys::Side::right && right_gain)
        --right_gain;
    for (std::size_t i = 0; i + 1 < scorers.size(); ++i) {
        if (left_gain) {
            scorers[i] = phys::Side::left;
            --left_gain;
        } else if (right_gain) {
            scorers[i] = phys::Side::right;
            --right_gain;
        }
    }

    RoundCompleted ev;
    ev.left_score = left_before;
    ev.right_score = right_before;
    ev.rounds_played = rounds_before;
    for (auto scorer : scorers) {
        ++ev.rounds_played;
        ev.scorer = scorer;
        if (scorer == phys::Side::left)
            ev.left_score = std::min(ev.left_score + 1, left_after);
        else
            ev.right_score = std::min(ev.right_score + 1, right_after);
        if (ev.rounds_played == rounds_after) {
            ev.left_score = left_after;
            ev.right_score = right_after;
        }
        push_round_event(ev);
    }
    m_state = SessionState::round_complete;
    m_round_adopted = true;
}

void MatchSession::push_round_event(const RoundCompleted &ev)
{
    metrics::match().rounds_completed.fetch_add(1, std::memory_order_relaxed);
    m_events.emplace_back(ev);
    log::info("[session {}] round {}/{} to {} ({}-{})", m_id, ev.rounds_played, m_sim->config().rounds,
        phys::to_string(ev.scorer), ev.left_score, ev.right_score);
}

void MatchSession::apply(const pong::ServerMessage &msg, Clock::time_point now)
{
    const bool playing = m_state == SessionState::active || m_state == SessionState::round_complete;
    switch (msg.msg_case()) {
        case pong::ServerMessage::kStartGame:
            if (m_state == SessionState::queued || m_state == SessionState::idle)
                activate_multiplayer(msg.start_game(), now);
            else
                log::warn("[session {}] start_game ignored in state {}", m_id, to_string(m_state));
            break;
        case pong::ServerMessage::kGameUpdate:
            if (playing)
                apply_game_update(msg.game_update(), now);
            break;
        case pong::ServerMessage::kGameOver:
            if (playing)
                finish(EndReason::peer_game_over, false);
            break;
        case pong::ServerMessage::kOpponentLeft:
            if (playing) {
                log::info("[session {}] opponent left: {}", m_id, msg.opponent_left().message());
                finish(EndReason::forfeit, false);
            }
            break;
        case pong::ServerMessage::kQueueUpdate:
            m_queue_position = msg.queue_update().position();
            log::debug("[session {}] queue: {} (position {})", m_id, msg.queue_update().message(), m_queue_position);
            break;
        case pong::ServerMessage::kWaitingList:
            log::trace("[session {}] waiting list size={}", m_id, msg.waiting_list().entries_size());
            break;
        case pong::ServerMessage::kRejoined:
            if (m_sync)
                m_sync->note_inbound(now);
            log::info("[session {}] rejoined room {}", m_id, msg.rejoined().room());
            break;
        case pong::ServerMessage::kError:
            m_last_error = msg.error().message();
            log::warn("[session {}] relay error {}: {}", m_id, msg.error().code(), m_last_error);
            if (m_state == SessionState::queued)
                m_state = SessionState::idle;
            break;
        case pong::ServerMessage::kTournamentUpdate:
        case pong::ServerMessage::kHeartbeatResp:
        case pong::ServerMessage::MSG_NOT_SET:
            break;
    }
}

void MatchSession::tick(Clock::time_point now, float dt)
{
    m_round_adopted = false;
    auto inbox = std::exchange(m_inbox, {});
    for (const auto &msg : inbox) {
        apply(msg, now);
        if (m_state == SessionState::finished)
            break;
    }
    if (m_state != SessionState::active && m_state != SessionState::round_complete)
        return;

    if (m_multiplayer) {
        if (m_sync->desynced()) {
            finish(EndReason::desync, false);
            return;
        }
        // A snapshot may have carried the final round.
        if (m_sim->halted()) {
            finish(EndReason::target_reached, false);
            return;
        }
        if (auto ann = m_sync->poll_announce(now))
            push_game_update(std::move(*ann));
        check_liveness(now);
        if (m_state == SessionState::finished || !m_sync->ready())
            return;
        if (!m_sim->started())
            m_sim->start();
        // The handshake may have moved us to the other paddle.
        if (m_autopilot && m_autopilot->side() != local_side())
            m_autopilot = std::make_unique<AiController>(local_side(), *m_autopilot_difficulty, mix(m_id) + 2);
    }
    step(now, dt);
}

void MatchSession::step(Clock::time_point now, float dt)
{
    if (m_state == SessionState::round_complete && !m_round_adopted)
        m_state = SessionState::active;

    phys::Court &court = m_sim->court();
    if (m_opponent_ai)
        m_opponent_ai->update(court, dt, now);
    if (m_autopilot)
        m_autopilot->update(court, dt, now);

    bool may_score = true;
    if (m_sync) {
        may_score = m_sync->has_authority(court);
        if (!may_score && m_deferred_since && now - *m_deferred_since >= m_sync->tuning().deferred_exit_limit) {
            log::warn("[session {}] peer never reported the round, scoring locally", m_id);
            may_score = true;
        }
    }

    auto rep = m_sim->tick(dt, may_score);
    if (rep.exit_deferred) {
        if (!m_deferred_since)
            m_deferred_since = now;
    } else {
        m_deferred_since.reset();
    }

    if (rep.round_completed) {
        m_state = SessionState::round_complete;
        RoundCompleted ev;
        ev.rounds_played = m_sim->rounds_played();
        ev.scorer = *rep.scorer;
        ev.left_score = m_sim->score(phys::Side::left);
        ev.right_score = m_sim->score(phys::Side::right);
        push_round_event(ev);
    }

    if (m_sync) {
        if (auto snap = m_sync->make_snapshot(*m_sim, now, rep.round_completed))
            push_game_update(std::move(*snap));
        const auto &mine = court.paddle(local_side());
        if (auto pad = m_sync->make_paddle_update(mine.y, now))
            push_game_update(std::move(*pad));
    }

    if (rep.game_over)
        finish(EndReason::target_reached, true);
}

void MatchSession::check_liveness(Clock::time_point now)
{
    if (!m_sync->silent(now))
        return;
    if (m_reconnect_requested) {
        log::warn("[session {}] still no traffic from peer after reconnect", m_id);
        finish(EndReason::connection_lost, false);
        return;
    }
    m_reconnect_requested = true;
    m_sync->note_inbound(now); // second silence window starts now
    metrics::match().reconnect_attempts.fetch_add(1, std::memory_order_relaxed);

    pong::ClientMessage rejoin;
    rejoin.mutable_rejoin()->set_room(m_room);
    rejoin.mutable_rejoin()->set_player_side(to_wire(local_side()));
    rejoin.mutable_rejoin()->set_nickname(m_who.nickname);
    m_outbox.push_back(std::move(rejoin));
    m_events.emplace_back(ReconnectRequested{m_room, local_side()});
    log::warn("[session {}] peer silent for {}ms, requesting reconnect", m_id,
        std::chrono::duration_cast<std::chrono::milliseconds>(m_sync->tuning().silence_limit).count());
}

void MatchSession::report_reconnect(bool ok, Clock::time_point now)
{
    if (m_state == SessionState::finished)
        return;
    if (!ok) {
        finish(EndReason::connection_lost, false);
        return;
    }
    if (m_sync)
        m_sync->note_inbound(now);
}

void MatchSession::abandon()
{
    if (m_state == SessionState::queued) {
        leave_queue();
        return;
    }
    if (m_state == SessionState::active || m_state == SessionState::round_complete)
        finish(EndReason::abandoned, false);
}

void MatchSession::finish(EndReason reason, bool notify_relay)
{
    if (m_state == SessionState::finished)
        return;
    const bool was_playing = m_state == SessionState::active || m_state == SessionState::round_complete;
    m_state = SessionState::finished;

    MatchResult res;
    res.is_multiplayer = m_multiplayer;
    res.is_tournament = m_tournament;
    res.reason = reason;
    res.local_side = local_side();
    if (m_sim) {
        m_sim->halt();
        res.rounds_played = m_sim->rounds_played();
        res.target_rounds = m_sim->config().rounds;
        res.left_score = m_sim->score(phys::Side::left);
        res.right_score = m_sim->score(phys::Side::right);
        res.last_scorer = m_sim->last_scorer();
    } else {
        res.target_rounds = m_base.rounds;
    }
    m_result = res;

    auto &mc = metrics::match();
    if (was_playing)
        metrics::gauge_dec(mc.active_sessions);
    mc.matches_finished.fetch_add(1, std::memory_order_relaxed);
    if (reason == EndReason::forfeit)
        mc.forfeits.fetch_add(1, std::memory_order_relaxed);
    else if (reason == EndReason::connection_lost)
        mc.connection_lost.fetch_add(1, std::memory_order_relaxed);

    if (m_multiplayer && notify_relay) {
        auto winner = res.winner();
        const std::string winner_name = winner && *winner == res.local_side ? m_who.nickname : m_opponent;
        pong::ClientMessage msg;
        if (m_tournament) {
            auto *tgo = msg.mutable_tournament_game_over();
            tgo->set_tournament_id(m_tournament_id);
            tgo->set_match_id(m_match_id);
            tgo->set_score(res.local_score());
            tgo->set_winner(winner_name);
        } else {
            auto *go = msg.mutable_game_over();
            go->set_score(res.local_score());
            go->set_winner(winner_name);
        }
        m_outbox.push_back(std::move(msg));
    }

    m_events.emplace_back(MatchFinished{res});
    log::info("[session {}] finished reason={} score {}-{} rounds {}/{}", m_id, to_string(reason), res.left_score,
        res.right_score, res.rounds_played, res.target_rounds);
}

void MatchSession::push_game_update(pong::GameUpdate upd)
{
    pong::ClientMessage msg;
    *msg.mutable_game_update() = std::move(upd);
    m_outbox.push_back(std::move(msg));
}

std::vector<pong::ClientMessage> MatchSession::drain_outbox()
{
    return std::exchange(m_outbox, {});
}

std::vector<SessionEvent> MatchSession::drain_events()
{
    return std::exchange(m_events, {});
}

} // namespace pong::game
