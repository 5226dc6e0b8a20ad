// SPDX-License-Identifier: Apache-2.0
// Match lifecycle: single player against the AI, queueing, two networked
// sessions wired back to back through an in-process relay stand-in, and the
// early exits (forfeit, lost connection).
#include "game/match_session.hpp"

#include <cassert>
#include <iostream>
#include <variant>

using namespace pong;
using namespace std::chrono_literals;
using Clock = game::MatchSession::Clock;

static uint32_t count_rounds(const std::vector<game::SessionEvent> &evs)
{
    uint32_t n = 0;
    for (const auto &e : evs)
        if (std::holds_alternative<game::RoundCompleted>(e))
            ++n;
    return n;
}

static game::MatchResult play_single(uint64_t seed)
{
    game::MatchConfig cfg;
    cfg.rounds = 2;
    cfg.seed = seed;
    game::MatchSession s(cfg, {"alice", "test_user_alice"}, 1);
    auto t = Clock::now();
    s.start_single_player(t);
    assert(s.state() == game::SessionState::active);
    assert(!s.is_multiplayer() && s.opponent() == "AI");
    uint32_t rounds = 0;
    for (int i = 0; i < 200000 && s.state() != game::SessionState::finished; ++i) {
        t += 16ms;
        s.tick(t, 1.f);
        rounds += count_rounds(s.drain_events());
    }
    assert(s.state() == game::SessionState::finished);
    assert(rounds == 2);
    assert(s.drain_outbox().empty()); // nothing goes to a relay
    return *s.result();
}

static void test_single_player()
{
    auto r1 = play_single(42);
    assert(r1.rounds_played == 2 && r1.target_rounds == 2);
    assert(r1.reason == game::EndReason::target_reached);
    assert(!r1.is_multiplayer && !r1.is_tournament);
    assert(r1.left_score + r1.right_score == 2);
    assert(r1.winner());

    // Same seed, same match.
    auto r2 = play_single(42);
    assert(r2.left_score == r1.left_score && r2.right_score == r1.right_score);
}

static void test_invalid_config()
{
    game::MatchConfig cfg;
    cfg.rounds = 0;
    bool threw = false;
    try {
        game::MatchSession s(cfg, {"alice", "t"}, 1);
    } catch (const game::InvalidConfig &) {
        threw = true;
    }
    assert(threw);
}

static void test_queue()
{
    game::MatchConfig cfg;
    cfg.rounds = 5;
    game::MatchSession s(cfg, {"alice", "test_user_alice"}, 7);
    assert(s.enqueue());
    assert(!s.enqueue());
    assert(s.state() == game::SessionState::queued);
    auto out = s.drain_outbox();
    assert(out.size() == 1 && out[0].has_join());
    assert(out[0].join().nickname() == "alice" && out[0].join().rounds() == 5);

    pong::ServerMessage qu;
    qu.mutable_queue_update()->set_position(2);
    s.on_message(qu);
    s.tick(Clock::now(), 1.f);
    assert(s.queue_position() == 2);

    pong::ServerMessage err;
    err.mutable_error()->set_code("auth_failed");
    err.mutable_error()->set_message("token rejected");
    s.on_message(err);
    s.tick(Clock::now(), 1.f);
    assert(s.state() == game::SessionState::idle);
    assert(s.last_error() == "token rejected");

    assert(s.enqueue());
    s.drain_outbox();
    assert(s.leave_queue());
    out = s.drain_outbox();
    assert(out.size() == 1 && out[0].has_leave_queue());
    assert(s.state() == game::SessionState::idle);
}

static pong::ServerMessage start_game(pong::Side side, const std::string &opponent, bool tournament)
{
    pong::ServerMessage m;
    auto *sg = m.mutable_start_game();
    sg->set_room("game_1");
    sg->set_rounds(3);
    sg->set_player_side(side);
    sg->set_opponent(opponent);
    sg->set_seed(4242);
    sg->set_is_tournament(tournament);
    if (tournament) {
        sg->set_tournament_id("t_1");
        sg->set_match_id("r1s0");
    }
    return m;
}

// Forwards game updates like the relay does and answers a result report
// with game_over to the other side.
static void relay(game::MatchSession &from, game::MatchSession &to, std::vector<pong::ClientMessage> &reports)
{
    for (auto &msg : from.drain_outbox()) {
        pong::ServerMessage sm;
        switch (msg.msg_case()) {
            case pong::ClientMessage::kGameUpdate:
                *sm.mutable_game_update() = msg.game_update();
                to.on_message(sm);
                break;
            case pong::ClientMessage::kGameOver:
                sm.mutable_game_over()->set_winner(msg.game_over().winner());
                to.on_message(sm);
                reports.push_back(msg);
                break;
            case pong::ClientMessage::kTournamentGameOver:
                sm.mutable_game_over()->set_winner(msg.tournament_game_over().winner());
                to.on_message(sm);
                reports.push_back(msg);
                break;
            default:
                break;
        }
    }
}

static void test_networked_pair(bool tournament)
{
    game::MatchConfig cfg;
    game::MatchSession a(cfg, {"alice", "test_user_alice"}, 11);
    game::MatchSession b(cfg, {"bob", "test_user_bob"}, 22);
    a.enable_autopilot(0.7f);
    b.enable_autopilot(0.7f);
    a.on_message(start_game(pong::SIDE_LEFT, "bob", tournament));
    b.on_message(start_game(pong::SIDE_RIGHT, "alice", tournament));

    std::vector<pong::ClientMessage> reports;
    uint32_t a_rounds = 0;
    uint32_t b_rounds = 0;
    auto t = Clock::now();
    for (int i = 0; i < 400000; ++i) {
        if (a.state() == game::SessionState::finished && b.state() == game::SessionState::finished)
            break;
        t += 16ms;
        a.tick(t, 1.f);
        relay(a, b, reports);
        b.tick(t, 1.f);
        relay(b, a, reports);
        a_rounds += count_rounds(a.drain_events());
        b_rounds += count_rounds(b.drain_events());
    }
    assert(a.state() == game::SessionState::finished && b.state() == game::SessionState::finished);
    assert(a.is_multiplayer() && a.is_tournament() == tournament);
    assert(a.local_side() == phys::Side::left && b.local_side() == phys::Side::right);
    assert(a.sync()->ready() && b.sync()->ready());
    assert(!a.sync()->desynced() && !b.sync()->desynced());

    const auto &ra = *a.result();
    const auto &rb = *b.result();
    assert(ra.rounds_played == 3 && rb.rounds_played == 3);
    // Both peers see every round, whichever of them counted it.
    assert(a_rounds == 3 && b_rounds == 3);
    assert(ra.left_score == rb.left_score && ra.right_score == rb.right_score);
    assert(ra.winner() == rb.winner());

    assert(!reports.empty());
    const std::string expected = *ra.winner() == phys::Side::left ? "alice" : "bob";
    if (tournament) {
        assert(reports[0].has_tournament_game_over());
        assert(reports[0].tournament_game_over().tournament_id() == "t_1");
        assert(reports[0].tournament_game_over().match_id() == "r1s0");
        assert(reports[0].tournament_game_over().winner() == expected);
    } else {
        assert(reports[0].has_game_over());
        assert(reports[0].game_over().winner() == expected);
    }
}

static pong::ServerMessage peer_update(pong::GameUpdate upd)
{
    pong::ServerMessage m;
    *m.mutable_game_update() = std::move(upd);
    return m;
}

static pong::ServerMessage peer_snapshot(uint64_t frame, uint32_t rounds, uint32_t left, uint32_t right)
{
    pong::GameUpdate upd;
    auto *st = upd.mutable_sync_state();
    st->set_frame(frame);
    st->mutable_ball()->set_x(400.f);
    st->mutable_ball()->set_y(200.f);
    st->mutable_ball()->set_vx(-4.f);
    st->mutable_ball()->set_speed(4.f);
    st->set_rounds_played(rounds);
    st->set_left_score(left);
    st->set_right_score(right);
    st->set_left_paddle_y(150.f);
    st->set_right_paddle_y(150.f);
    return peer_update(std::move(upd));
}

static std::vector<game::RoundCompleted> rounds_of(const std::vector<game::SessionEvent> &evs)
{
    std::vector<game::RoundCompleted> out;
    for (const auto &e : evs)
        if (auto *rc = std::get_if<game::RoundCompleted>(&e))
            out.push_back(*rc);
    return out;
}

static void test_rounds_adopted_from_peer()
{
    game::MatchConfig cfg;
    game::MatchSession s(cfg, {"bob", "t"}, 6);
    s.on_message(start_game(pong::SIDE_RIGHT, "alice", false));
    auto t = Clock::now();
    s.tick(t, 1.f);

    pong::GameUpdate ann;
    ann.mutable_host_announce()->set_side(pong::SIDE_LEFT);
    ann.mutable_host_announce()->set_nonce(1);
    s.on_message(peer_update(std::move(ann)));
    t += 16ms;
    s.tick(t, 1.f);
    assert(s.sync()->ready());
    s.drain_events();
    s.drain_outbox();

    // The host counted the first point.
    s.on_message(peer_snapshot(1, 1, 1, 0));
    t += 16ms;
    s.tick(t, 1.f);
    auto rounds = rounds_of(s.drain_events());
    assert(rounds.size() == 1);
    assert(rounds[0].rounds_played == 1 && rounds[0].scorer == phys::Side::left);
    assert(rounds[0].left_score == 1 && rounds[0].right_score == 0);
    assert(s.state() == game::SessionState::round_complete);
    assert(s.simulation()->rounds_played() == 1);
    t += 16ms;
    s.tick(t, 1.f);
    assert(s.state() == game::SessionState::active);

    // Two rounds in one snapshot still give one event each, the last one
    // ending the match.
    s.on_message(peer_snapshot(2, 3, 2, 1));
    t += 16ms;
    s.tick(t, 1.f);
    rounds = rounds_of(s.drain_events());
    assert(rounds.size() == 2);
    assert(rounds[0].rounds_played == 2 && rounds[0].scorer == phys::Side::right);
    assert(rounds[0].left_score == 1 && rounds[0].right_score == 1);
    assert(rounds[1].rounds_played == 3 && rounds[1].scorer == phys::Side::left);
    assert(rounds[1].left_score == 2 && rounds[1].right_score == 1);
    assert(s.state() == game::SessionState::finished);
    assert(s.result()->reason == game::EndReason::target_reached);
    for (auto &m : s.drain_outbox())
        assert(!m.has_game_over());
}

static void test_forfeit()
{
    game::MatchConfig cfg;
    game::MatchSession s(cfg, {"alice", "t"}, 3);
    s.on_message(start_game(pong::SIDE_LEFT, "bob", false));
    auto t = Clock::now();
    s.tick(t, 1.f);
    assert(s.state() == game::SessionState::active);
    s.drain_outbox();

    pong::ServerMessage left;
    left.mutable_opponent_left()->set_message("bob left the game");
    s.on_message(left);
    s.tick(t + 16ms, 1.f);
    assert(s.state() == game::SessionState::finished);
    assert(s.result()->reason == game::EndReason::forfeit);
    for (auto &m : s.drain_outbox())
        assert(!m.has_game_over());
}

static void test_connection_lost()
{
    game::MatchConfig cfg;
    game::MatchSession s(cfg, {"alice", "t"}, 4);
    s.on_message(start_game(pong::SIDE_RIGHT, "bob", false));
    auto t = Clock::now();
    s.tick(t, 1.f);
    s.drain_outbox();

    // Peer never answers: one reconnect attempt, then give up.
    bool asked = false;
    for (int i = 0; i < 1000 && s.state() != game::SessionState::finished; ++i) {
        t += 16ms;
        s.tick(t, 1.f);
        for (auto &ev : s.drain_events()) {
            if (auto *rr = std::get_if<game::ReconnectRequested>(&ev)) {
                asked = true;
                assert(rr->room == "game_1" && rr->side == phys::Side::right);
            }
        }
        for (auto &m : s.drain_outbox())
            if (m.has_rejoin())
                assert(m.rejoin().room() == "game_1" && m.rejoin().nickname() == "alice");
    }
    assert(asked);
    assert(s.state() == game::SessionState::finished);
    assert(s.result()->reason == game::EndReason::connection_lost);

    // A failed reconnect ends the match at once.
    game::MatchSession s2(cfg, {"alice", "t"}, 5);
    s2.on_message(start_game(pong::SIDE_LEFT, "bob", false));
    s2.tick(Clock::now(), 1.f);
    s2.report_reconnect(false, Clock::now());
    assert(s2.state() == game::SessionState::finished);
    assert(s2.result()->reason == game::EndReason::connection_lost);
}

int main()
{
    test_single_player();
    test_invalid_config();
    test_queue();
    test_networked_pair(false);
    test_networked_pair(true);
    test_rounds_adopted_from_peer();
    test_forfeit();
    test_connection_lost();
    std::cout << "unit_match_session OK" << std::endl;
    return 0;
}
