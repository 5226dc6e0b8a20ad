// SPDX-License-Identifier: Apache-2.0
// Relay plus two headless peers on autopilot: queue, pair, play a full
// networked match over TCP and agree on the result.
#include "client/match_runner.hpp"
#include "client/relay_link.hpp"
#include "game/leaderboard.hpp"
#include "game/match_session.hpp"
#include "server/matchmaking/matchmaker.hpp"
#include "server/net/listener.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <cassert>
#include <iostream>
#include <optional>

using namespace std::chrono_literals;
using namespace pong;

static std::atomic_bool g_stop{false};

static coro::task<void> watchdog(std::shared_ptr<coro::io_scheduler> sched)
{
    co_await sched->schedule();
    co_await sched->yield_for(120s);
    std::cout << "[e2e] watchdog fired" << std::endl;
    g_stop.store(true);
}

static std::atomic_int g_done{0};

static coro::task<void> play(std::shared_ptr<coro::io_scheduler> sched, uint16_t port, std::string nickname,
    uint64_t id, game::LeaderboardReporter &board, std::optional<game::MatchResult> &out)
{
    co_await sched->schedule();
    co_await sched->yield_for(100ms);
    client::RelayLink link{sched, "127.0.0.1", port};
    bool ok = co_await link.connect(2000ms);
    assert(ok);

    game::MatchConfig cfg;
    cfg.rounds = 3;
    cfg.initial_ball_speed = 8.f;
    const game::PlayerIdentity who{nickname, "test_user_" + nickname};
    game::MatchSession session(cfg, who, id);
    session.enable_autopilot(0.5f);
    ok = session.enqueue();
    assert(ok);

    client::MatchRunner runner(sched, link, client::RunnerOptions{60, 500ms, 1000ms});
    co_await runner.run(session, g_stop);
    assert(session.result());
    std::cout << "[e2e] " << nickname << " finished: " << game::to_string(session.result()->reason) << " "
              << session.result()->left_score << "-" << session.result()->right_score << std::endl;
    client::publish_result(*session.result(), who, &board);
    link.close();
    out = session.result();
    g_done.fetch_add(1, std::memory_order_release);
}

static coro::task<void> wait_both(std::shared_ptr<coro::io_scheduler> sched)
{
    co_await sched->schedule();
    while (g_done.load(std::memory_order_acquire) < 2 && !g_stop.load())
        co_await sched->yield_for(50ms);
}

int main()
{
    auto sched = coro::default_executor::io_executor();
    uint16_t port = 41060;
    sched->spawn(net::run_listener(sched, port));
    sched->spawn(mm::run_matchmaker(sched, mm::MatchmakerConfig{20, 4242}));
    sched->spawn(watchdog(sched));

    game::LogReporter board;
    std::optional<game::MatchResult> ra;
    std::optional<game::MatchResult> rb;
    sched->spawn(play(sched, port, "lefty", 1, board, ra));
    sched->spawn(play(sched, port, "righty", 2, board, rb));
    coro::sync_wait(wait_both(sched));
    assert(!g_stop.load());
    assert(ra && rb);
    const game::MatchResult &a = *ra;
    const game::MatchResult &b = *rb;

    assert(a.is_multiplayer && b.is_multiplayer);
    assert(a.local_side != b.local_side);
    assert(a.rounds_played == 3 && b.rounds_played == 3);
    assert(a.left_score == b.left_score && a.right_score == b.right_score);
    assert(a.winner() && a.winner() == b.winner());
    for (const auto &r : {a, b})
        assert(r.reason == game::EndReason::target_reached || r.reason == game::EndReason::peer_game_over);

    // Exactly one of the two got a win on the board.
    uint32_t wins = 0;
    for (const auto &s : board.standings())
        wins += s.wins;
    assert(wins == 1);
    std::cout << "e2e_peer_match OK" << std::endl;
    return 0;
}
