// SPDX-License-Identifier: Apache-2.0
// match_runner.hpp - fixed-rate loop that drives a MatchSession: feeds it
// relay traffic, ticks it, flushes its outbox and services reconnects.
#pragma once
#include "client/relay_link.hpp"
#include "game/leaderboard.hpp"
#include "game/match_session.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

namespace pong::client {

struct RunnerOptions
{
    uint32_t tick_hz{60};
    std::chrono::milliseconds heartbeat_interval{2000};
    std::chrono::milliseconds reconnect_timeout{2000};
};

class MatchRunner
{
public:
    MatchRunner(std::shared_ptr<coro::io_scheduler> scheduler, RelayLink &link, RunnerOptions opts);

    // Ticks the session until it finishes or stop is set; on stop the session
    // is abandoned and its last messages flushed. Traffic meant for whoever
    // runs the next match (tournament updates, the next start_game) is kept
    // for take_pending().
    coro::task<void> run(game::MatchSession &session, const std::atomic_bool &stop);

    // Reads the link for up to wait without a session attached. Returns
    // pending messages first; nullopt once the link is gone.
    coro::task<std::optional<std::vector<pong::ServerMessage>>> pump(std::chrono::milliseconds wait);

    std::vector<pong::ServerMessage> take_pending();
    uint64_t ticks() const { return m_ticks; }

private:
    void route(game::MatchSession &session, pong::ServerMessage msg, game::MatchSession::Clock::time_point now);
    coro::task<void> service_reconnect(game::MatchSession &session);
    coro::task<void> maybe_heartbeat(std::chrono::steady_clock::time_point now);

    std::shared_ptr<coro::io_scheduler> m_scheduler;
    RelayLink &m_link;
    RunnerOptions m_opts;
    std::deque<pong::ServerMessage> m_pending;
    std::optional<std::chrono::steady_clock::time_point> m_last_heartbeat;
    uint64_t m_ticks{0};
};

// Runs a single player match without a relay. realtime paces ticks against
// the wall clock; otherwise time advances one tick period per step. Returns
// the result once the session finishes or stop is set.
game::MatchResult run_local(game::MatchSession &session, uint32_t tick_hz, const std::atomic_bool &stop,
    bool realtime);

// Sends a finished non-tournament result to the leaderboard. No-op for
// tournament matches or a null reporter.
std::optional<game::ReportOutcome> publish_result(const game::MatchResult &res, const game::PlayerIdentity &who,
    game::LeaderboardReporter *reporter);

} // namespace pong::client
