// SPDX-License-Identifier: Apache-2.0
#include "client/match_runner.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <thread>
#include <utility>
#include <variant>

namespace pong::client {

namespace {

using Clock = std::chrono::steady_clock;

Clock::duration tick_period(uint32_t hz)
{
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / (hz ? hz : 60)));
}

// Simulation time is measured in 60 Hz frames.
float frames(Clock::duration d)
{
    return std::chrono::duration<float>(d).count() * 60.f;
}

bool playing(game::SessionState s)
{
    return s == game::SessionState::active || s == game::SessionState::round_complete;
}

} // namespace

MatchRunner::MatchRunner(std::shared_ptr<coro::io_scheduler> scheduler, RelayLink &link, RunnerOptions opts)
    : m_scheduler(std::move(scheduler)), m_link(link), m_opts(opts)
{}

std::vector<pong::ServerMessage> MatchRunner::take_pending()
{
    std::vector<pong::ServerMessage> out(std::make_move_iterator(m_pending.begin()),
        std::make_move_iterator(m_pending.end()));
    m_pending.clear();
    return out;
}

void MatchRunner::route(game::MatchSession &session, pong::ServerMessage msg, Clock::time_point now)
{
    const auto state = session.state();
    switch (msg.msg_case()) {
        case pong::ServerMessage::kTournamentUpdate:
            m_pending.push_back(std::move(msg));
            return;
        case pong::ServerMessage::kStartGame:
            if (state != game::SessionState::idle && state != game::SessionState::queued) {
                m_pending.push_back(std::move(msg));
                return;
            }
            break;
        case pong::ServerMessage::kRejoined:
            session.report_reconnect(true, now);
            break;
        case pong::ServerMessage::kError:
            if (msg.error().code() == "rejoin_failed") {
                session.report_reconnect(false, now);
                return;
            }
            break;
        default:
            break;
    }
    if (state == game::SessionState::finished) {
        m_pending.push_back(std::move(msg));
        return;
    }
    session.on_message(std::move(msg));
}

coro::task<void> MatchRunner::service_reconnect(game::MatchSession &session)
{
    if (m_link.connected())
        co_return; // the queued rejoin goes out on the live socket
    log::warn("[runner] link down, reconnecting for room {}", session.room());
    const bool ok = co_await m_link.reconnect(m_opts.reconnect_timeout);
    if (!ok)
        session.report_reconnect(false, Clock::now());
}

coro::task<void> MatchRunner::maybe_heartbeat(Clock::time_point now)
{
    if (m_last_heartbeat && now - *m_last_heartbeat < m_opts.heartbeat_interval)
        co_return;
    m_last_heartbeat = now;
    pong::ClientMessage hb;
    hb.mutable_heartbeat()->set_time_ms(static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
            .count()));
    if (!co_await m_link.send(hb))
        log::debug("[runner] heartbeat not sent, link down");
}

coro::task<void> MatchRunner::run(game::MatchSession &session, const std::atomic_bool &stop)
{
    const auto period = tick_period(m_opts.tick_hz);
    auto last = Clock::now();
    // Anything parked while no session was attached belongs to this one.
    for (auto &msg : take_pending())
        route(session, std::move(msg), last);

    while (session.state() != game::SessionState::finished) {
        if (stop.load()) {
            log::info("[runner] stop requested, abandoning session {}", session.id());
            session.abandon();
            if (!co_await m_link.send(session.drain_outbox()))
                log::debug("[runner] leave notice for session {} not sent", session.id());
            break;
        }
        if (m_link.connected()) {
            auto msgs = co_await m_link.poll_recv(std::chrono::milliseconds(1));
            if (msgs) {
                const auto now = Clock::now();
                for (auto &m : *msgs)
                    route(session, std::move(m), now);
            }
        }

        const auto now = Clock::now();
        const float dt = frames(now - last);
        last = now;
        const auto t0 = Clock::now();
        session.tick(now, dt);
        metrics::add_tick_duration(
            static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - t0).count()));
        ++m_ticks;

        for (auto &ev : session.drain_events()) {
            if (std::holds_alternative<game::ReconnectRequested>(ev))
                co_await service_reconnect(session);
        }
        auto out = session.drain_outbox();
        if (!out.empty() && m_link.connected() && !co_await m_link.send(out))
            log::warn("[runner] relay link lost while sending, session {}", session.id());
        if (m_link.connected())
            co_await maybe_heartbeat(now);

        const auto spent = Clock::now() - now;
        if (spent < period)
            co_await m_scheduler->yield_for(std::chrono::duration_cast<std::chrono::milliseconds>(period - spent));
    }
    // game_over / tournament_game_over queued by the final tick.
    auto out = session.drain_outbox();
    if (!out.empty() && m_link.connected() && !co_await m_link.send(out))
        log::warn("[runner] final messages of session {} not delivered", session.id());
}

coro::task<std::optional<std::vector<pong::ServerMessage>>> MatchRunner::pump(std::chrono::milliseconds wait)
{
    std::vector<pong::ServerMessage> out = take_pending();
    if (!out.empty())
        co_return out;
    if (!m_link.connected())
        co_return std::nullopt;
    co_await maybe_heartbeat(Clock::now());
    auto msgs = co_await m_link.poll_recv(wait);
    if (!msgs)
        co_return std::nullopt;
    co_return std::move(*msgs);
}

game::MatchResult run_local(game::MatchSession &session, uint32_t tick_hz, const std::atomic_bool &stop,
    bool realtime)
{
    const auto period = tick_period(tick_hz);
    auto now = Clock::now();
    if (session.state() == game::SessionState::idle)
        session.start_single_player(now);
    while (playing(session.state())) {
        if (stop.load()) {
            session.abandon();
            break;
        }
        if (realtime) {
            std::this_thread::sleep_for(period);
            const auto t = Clock::now();
            session.tick(t, frames(t - now));
            now = t;
        } else {
            now += period;
            session.tick(now, frames(period));
        }
        session.drain_events();
    }
    return session.result().value_or(game::MatchResult{});
}

std::optional<game::ReportOutcome> publish_result(const game::MatchResult &res, const game::PlayerIdentity &who,
    game::LeaderboardReporter *reporter)
{
    if (!reporter || res.is_tournament)
        return std::nullopt;
    if (res.reason == game::EndReason::abandoned || res.reason == game::EndReason::desync)
        return std::nullopt;
    game::LeaderboardEntry entry{who.nickname, who.token, res.local_score(), res.target_rounds};
    auto outcome = reporter->report(entry);
    if (!outcome.success)
        log::warn("[leaderboard] report for {} rejected: {}", who.nickname, outcome.reason);
    return outcome;
}

} // namespace pong::client
