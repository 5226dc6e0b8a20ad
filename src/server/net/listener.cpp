// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "common/framing.hpp"
#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/auth/auth_provider.hpp"
#include "server/matchmaking/matchmaker.hpp"
#include "server/tournament/tournament_service.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <chrono>
#include <span>
#include <string>
#include <vector>

namespace pong::net {

namespace {

coro::task<void> connection_loop(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<mm::Session> session);

void send_error(const std::shared_ptr<mm::Session> &s, const std::string &code, const std::string &message)
{
    pong::ServerMessage smsg;
    smsg.mutable_error()->set_code(code);
    smsg.mutable_error()->set_message(message);
    mm::instance().push_message(s, smsg);
}

// Validates and claims the nickname; sends an error and returns false on failure.
bool admit(const std::shared_ptr<mm::Session> &s, const std::string &nickname, const std::string &token)
{
    auto res = auth::check_join(nickname, token);
    if (!res.ok) {
        metrics::relay().auth_failures.fetch_add(1, std::memory_order_relaxed);
        log::warn("[conn {}] join rejected for '{}': {}", s->connection_id, nickname, res.reason);
        send_error(s, "auth_failed", res.reason);
        return false;
    }
    if (!mm::instance().register_player(s, nickname, res.player_id, token)) {
        log::warn("[conn {}] nickname '{}' already in use", s->connection_id, nickname);
        send_error(s, "name_taken", "nickname already in use");
        return false;
    }
    return true;
}

void on_join(const std::shared_ptr<mm::Session> &s, const pong::Join &j)
{
    if (!admit(s, j.nickname(), j.token()))
        return;
    if (!s->room.empty() || !s->tournament_id.empty()) {
        send_error(s, "busy", "already in a match or tournament");
        return;
    }
    const uint32_t rounds = j.rounds() > 0 ? j.rounds() : tour::service().config().default_rounds;
    auto &mgr = mm::instance();
    mgr.enqueue(s, rounds);
    pong::ServerMessage smsg;
    auto *qu = smsg.mutable_queue_update();
    qu->set_message("Waiting for an opponent");
    qu->set_rounds(rounds);
    mgr.push_message(s, smsg);
    log::info("[conn {}] {} queued for {} rounds", s->connection_id, s->nickname, rounds);
    mm::broadcast_waiting_list();
}

void on_game_update(const std::shared_ptr<mm::Session> &s, const pong::GameUpdate &upd)
{
    auto &mgr = mm::instance();
    auto partner = mgr.partner(s);
    if (!partner) {
        metrics::relay().game_updates_dropped.fetch_add(1, std::memory_order_relaxed);
        PONG_LOG_EVERY_N(debug, 200, "[conn {}] game_update without a room partner dropped", s->connection_id);
        return;
    }
    pong::ServerMessage smsg;
    *smsg.mutable_game_update() = upd;
    mgr.push_message(partner, smsg);
    metrics::relay().game_updates_relayed.fetch_add(1, std::memory_order_relaxed);
}

void on_game_over(const std::shared_ptr<mm::Session> &s, const pong::GameOver &go)
{
    auto &mgr = mm::instance();
    if (s->room.empty()) {
        log::debug("[conn {}] game_over outside a room ignored", s->connection_id);
        return;
    }
    const std::string room = s->room;
    pong::ServerMessage smsg;
    *smsg.mutable_game_over() = go;
    auto partner = mgr.close_room(s);
    if (partner)
        mgr.push_message(partner, smsg);
    mgr.push_message(s, smsg);
    log::info("[room {}] over, winner {} (reported by {})", room, go.winner(), s->nickname);
}

void on_tournament_create(const std::shared_ptr<mm::Session> &s, const pong::TournamentCreate &tc)
{
    if (!admit(s, tc.nickname(), tc.token()))
        return;
    if (s->in_queue)
        mm::instance().leave_queue(s);
    std::string id;
    auto st = tour::service().create(s, tc.rounds(), id);
    if (st != tour::ServiceStatus::ok)
        send_error(s, tour::to_string(st), "cannot create tournament");
}

void on_tournament_join(const std::shared_ptr<mm::Session> &s, const pong::TournamentJoin &tj)
{
    if (!admit(s, tj.nickname(), tj.token()))
        return;
    if (s->in_queue)
        mm::instance().leave_queue(s);
    auto st = tour::service().join(s, tj.tournament_id());
    if (st != tour::ServiceStatus::ok)
        send_error(s, tour::to_string(st), "cannot join " + tj.tournament_id());
}

void on_rejoin(const std::shared_ptr<mm::Session> &s, const pong::Rejoin &rj)
{
    auto &mgr = mm::instance();
    if (!mgr.rejoin(s, rj.room(), rj.player_side(), rj.nickname())) {
        log::info("[conn {}] rejoin of {} to {} refused", s->connection_id, rj.nickname(), rj.room());
        send_error(s, "rejoin_failed", "room " + rj.room() + " is gone");
        return;
    }
    pong::ServerMessage smsg;
    smsg.mutable_rejoined()->set_room(rj.room());
    mgr.push_message(s, smsg);
    log::info("[conn {}] {} rejoined {}", s->connection_id, rj.nickname(), rj.room());
}

void on_heartbeat(const std::shared_ptr<mm::Session> &s, const pong::Heartbeat &hb)
{
    auto &mgr = mm::instance();
    mgr.update_heartbeat(s);
    const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch())
                            .count();
    pong::ServerMessage smsg;
    auto *resp = smsg.mutable_heartbeat_resp();
    resp->set_client_time_ms(hb.time_ms());
    resp->set_server_time_ms(static_cast<uint64_t>(now_ms));
    mgr.push_message(s, smsg);
}

} // namespace

void handle_message(const std::shared_ptr<mm::Session> &session, const pong::ClientMessage &msg)
{
    auto &mgr = mm::instance();
    switch (msg.msg_case()) {
        case pong::ClientMessage::kJoin:
            on_join(session, msg.join());
            break;
        case pong::ClientMessage::kLeaveQueue:
            if (mgr.leave_queue(session)) {
                log::info("[conn {}] {} left the queue", session->connection_id, session->nickname);
                mm::broadcast_waiting_list();
            }
            break;
        case pong::ClientMessage::kGameUpdate:
            on_game_update(session, msg.game_update());
            break;
        case pong::ClientMessage::kGameOver:
            on_game_over(session, msg.game_over());
            break;
        case pong::ClientMessage::kTournamentGameOver: {
            const auto &tg = msg.tournament_game_over();
            auto st = tour::service().report(session, tg.tournament_id(), tg.match_id(), tg.winner(), tg.score());
            if (st != tour::RecordStatus::ok && st != tour::RecordStatus::already_recorded)
                send_error(session, tour::to_string(st), "result for " + tg.match_id() + " rejected");
            break;
        }
        case pong::ClientMessage::kTournamentCreate:
            on_tournament_create(session, msg.tournament_create());
            break;
        case pong::ClientMessage::kTournamentJoin:
            on_tournament_join(session, msg.tournament_join());
            break;
        case pong::ClientMessage::kTournamentStart: {
            auto st = tour::service().start(session, msg.tournament_start().tournament_id());
            if (st != tour::ServiceStatus::ok)
                send_error(session, tour::to_string(st), "cannot start tournament");
            break;
        }
        case pong::ClientMessage::kTournamentLeave: {
            auto st = tour::service().leave(session, msg.tournament_leave().tournament_id());
            if (st != tour::ServiceStatus::ok)
                send_error(session, tour::to_string(st), "cannot leave tournament");
            break;
        }
        case pong::ClientMessage::kRejoin:
            on_rejoin(session, msg.rejoin());
            break;
        case pong::ClientMessage::kHeartbeat:
            on_heartbeat(session, msg.heartbeat());
            break;
        case pong::ClientMessage::MSG_NOT_SET:
            PONG_LOG_EVERY_N(debug, 50, "[conn {}] empty client message", session->connection_id);
            break;
    }
}

void handle_disconnect(const std::shared_ptr<mm::Session> &session)
{
    auto &mgr = mm::instance();
    const bool was_queued = session->in_queue;
    tour::service().on_disconnect(session);
    auto partner = mgr.disconnect_session(session);
    if (partner) {
        pong::ServerMessage smsg;
        smsg.mutable_opponent_left()->set_message(session->nickname + " left the game");
        mgr.push_message(partner, smsg);
        metrics::relay().opponent_left_sent.fetch_add(1, std::memory_order_relaxed);
        log::info("[conn {}] {} left, told {}", session->connection_id, session->nickname, partner->nickname);
    }
    if (was_queued)
        mm::broadcast_waiting_list();
}

coro::task<void> run_listener(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port)
{
    co_await scheduler->schedule();
    log::info("[listener] starting TCP listener on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (true) {
        auto status = co_await server.poll();
        if (status == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                auto session = mm::instance().add_connection(std::move(client));
                scheduler->spawn(connection_loop(scheduler, session));
            }
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            log::error("[listener] poll error/closed, exiting listener loop");
            co_return;
        }
    }
}

namespace {

coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [s, remaining] = client.send(rest);
        if (s != coro::net::send_status::ok && s != coro::net::send_status::would_block)
            co_return false;
        rest = remaining;
    }
    co_return true;
}

coro::task<void> connection_loop(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<mm::Session> session)
{
    co_await scheduler->schedule();
    log::debug("[conn {}] new connection", session->connection_id);
    auto &mgr = mm::instance();
    netutil::FrameParseState fps;
    std::string tmp(4096, '\0');
    while (!session->closed) {
        auto pending = mgr.drain_messages(session);
        if (!pending.empty()) {
            std::string batch;
            batch.reserve(pending.size() * 64);
            for (auto &msg : pending)
                if (!netutil::append_message(batch, msg))
                    log::warn("[conn {}] failed to serialize server message", session->connection_id);
            if (!co_await send_all(*session->client, std::span<const char>(batch.data(), batch.size()))) {
                log::info("[conn {}] send failed", session->connection_id);
                break;
            }
        }
        auto pstat = co_await session->client->poll(coro::poll_op::read, std::chrono::milliseconds(50));
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat != coro::poll_status::event) {
            log::info("[conn {}] poll closed", session->connection_id);
            break;
        }
        auto [rstatus, span] = session->client->recv(tmp);
        if (rstatus == coro::net::recv_status::closed) {
            log::info("[conn {}] closed by peer", session->connection_id);
            break;
        }
        if (rstatus != coro::net::recv_status::ok && rstatus != coro::net::recv_status::would_block) {
            log::warn("[conn {}] recv error", session->connection_id);
            break;
        }
        if (rstatus == coro::net::recv_status::ok)
            netutil::feed(fps, span.data(), span.size());

        std::string payload;
        while (netutil::try_extract(fps, payload)) {
            pong::ClientMessage cmsg;
            if (!cmsg.ParseFromString(payload)) {
                fps.corrupt = true;
                break;
            }
            handle_message(session, cmsg);
        }
        if (fps.corrupt) {
            metrics::relay().malformed_frames.fetch_add(1, std::memory_order_relaxed);
            log::warn("[conn {}] malformed frame, dropping connection", session->connection_id);
            break;
        }
    }
    handle_disconnect(session);
}

} // namespace

} // namespace pong::net
