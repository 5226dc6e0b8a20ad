// SPDX-License-Identifier: Apache-2.0
#include "server/net/metrics_http.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <span>
#include <sstream>
#include <string>

namespace pong::net {

namespace {

void counter(std::ostringstream &oss, const char *name, const std::atomic<uint64_t> &v)
{
    oss << "# TYPE " << name << " counter\n" << name << " " << v.load(std::memory_order_relaxed) << "\n";
}

void gauge(std::ostringstream &oss, const char *name, const std::atomic<uint64_t> &v)
{
    oss << "# TYPE " << name << " gauge\n" << name << " " << v.load(std::memory_order_relaxed) << "\n";
}

} // namespace

std::string build_metrics_body()
{
    std::ostringstream oss;
    auto &rc = metrics::relay();
    gauge(oss, "pong_connected_players", rc.connected_players);
    gauge(oss, "pong_queue_depth", rc.queue_depth);
    gauge(oss, "pong_active_rooms", rc.active_rooms);
    gauge(oss, "pong_tournaments_active", rc.tournaments_active);
    counter(oss, "pong_rooms_created_total", rc.rooms_created);
    counter(oss, "pong_auth_failures_total", rc.auth_failures);
    counter(oss, "pong_game_updates_relayed_total", rc.game_updates_relayed);
    counter(oss, "pong_game_updates_dropped_total", rc.game_updates_dropped);
    counter(oss, "pong_malformed_frames_total", rc.malformed_frames);
    counter(oss, "pong_opponent_left_total", rc.opponent_left_sent);
    counter(oss, "pong_heartbeat_timeouts_total", rc.heartbeat_timeouts);
    counter(oss, "pong_rejoins_total", rc.rejoins_accepted);

    // Match and sync counters stay at zero on a pure relay; the in-process
    // test harness and embedded peers fill them.
    auto &mc = metrics::match();
    gauge(oss, "pong_match_sessions_active", mc.active_sessions);
    counter(oss, "pong_rounds_completed_total", mc.rounds_completed);
    counter(oss, "pong_matches_finished_total", mc.matches_finished);
    auto &sc = metrics::sync();
    counter(oss, "pong_sync_snapshots_sent_total", sc.snapshots_sent);
    counter(oss, "pong_sync_hard_snaps_total", sc.hard_snaps);
    counter(oss, "pong_sync_desyncs_total", sc.desyncs);

    // Tick duration histogram (ns), geometric x2 buckets.
    oss << "# TYPE pong_tick_duration_ns histogram\n";
    uint64_t cumulative = 0;
    for (int i = 0; i < metrics::MatchCounters::TICK_BUCKETS; ++i) {
        cumulative += mc.tick_hist[i].load(std::memory_order_relaxed);
        oss << "pong_tick_duration_ns_bucket{le=\"" << (metrics::MatchCounters::TICK_BASE_NS << i) << "\"} "
            << cumulative << "\n";
    }
    oss << "pong_tick_duration_ns_bucket{le=\"+Inf\"} " << mc.tick_samples.load(std::memory_order_relaxed) << "\n";
    oss << "pong_tick_duration_ns_sum " << mc.tick_duration_ns_accum.load(std::memory_order_relaxed) << "\n";
    oss << "pong_tick_duration_ns_count " << mc.tick_samples.load(std::memory_order_relaxed) << "\n";
    return oss.str();
}

static coro::task<void> handle_client(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    auto pol = co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(200));
    if (pol != coro::poll_status::event)
        co_return;
    std::string buf(1024, '\0');
    auto [rs, span] = client.recv(buf);
    if (rs != coro::net::recv_status::ok && rs != coro::net::recv_status::would_block)
        co_return;
    std::string_view req(span.data(), span.size());
    bool metrics = req.rfind("GET /metrics", 0) == 0;
    std::string body = metrics ? build_metrics_body() : std::string("not found\n");
    std::ostringstream resp;
    resp << "HTTP/1.1 " << (metrics ? "200 OK" : "404 Not Found") << "\r\n";
    resp << "Content-Type: text/plain; version=0.0.4\r\n";
    resp << "Content-Length: " << body.size() << "\r\n";
    resp << "Connection: close\r\n\r\n";
    resp << body;
    auto s = resp.str();
    std::span<const char> out{s.data(), s.size()};
    while (!out.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [st, rest] = client.send(out);
        if (st != coro::net::send_status::ok && st != coro::net::send_status::would_block)
            break;
        out = rest;
    }
}

coro::task<void> run_metrics_endpoint(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port)
{
    co_await scheduler->schedule();
    log::info("[metrics] HTTP endpoint on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (true) {
        auto st = co_await server.poll();
        if (st == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid())
                scheduler->spawn(handle_client(scheduler, std::move(client)));
        } else if (st == coro::poll_status::error || st == coro::poll_status::closed) {
            log::error("[metrics] server poll error/closed");
            co_return;
        }
    }
}

} // namespace pong::net
