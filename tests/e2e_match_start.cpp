// SPDX-License-Identifier: Apache-2.0
#include "e2e_wire.hpp"
#include "server/matchmaking/matchmaker.hpp"
#include "server/net/listener.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <cassert>
#include <iostream>

using namespace std::chrono_literals;

static coro::task<void> client_flow(std::shared_ptr<coro::io_scheduler> sched, uint16_t port)
{
    // Yield briefly to allow the listener to bind the port before connecting.
    co_await sched->yield_for(100ms);
    e2e::Conn a{sched, port};
    e2e::Conn b{sched, port};
    auto st = co_await a.cli.connect(2s);
    assert(st == coro::net::connect_status::connected);
    st = co_await b.cli.connect(2s);
    assert(st == coro::net::connect_status::connected);

    bool ok = co_await e2e::send_msg(a.cli, e2e::join("alice", 3));
    assert(ok);
    auto qa = co_await e2e::wait_for(a, pong::ServerMessage::kQueueUpdate, 3s);
    assert(qa && qa->queue_update().rounds() == 3);
    std::cout << "[e2e] alice queued" << std::endl;

    // Different match length: no pairing yet.
    ok = co_await e2e::send_msg(b.cli, e2e::join("bob", 5));
    assert(ok);
    auto wl = co_await e2e::wait_for(b, pong::ServerMessage::kWaitingList, 3s);
    assert(wl);
    co_await sched->yield_for(300ms);
    b.backlog.clear();
    a.backlog.clear();

    // Same length now; the longer waiter gets the left paddle.
    ok = co_await e2e::send_msg(b.cli, e2e::join("bob", 3));
    assert(ok);
    auto sa = co_await e2e::wait_for(a, pong::ServerMessage::kStartGame, 8s);
    auto sb = co_await e2e::wait_for(b, pong::ServerMessage::kStartGame, 8s);
    assert(sa && sb);
    std::cout << "[e2e] got StartGame room=" << sa->start_game().room() << std::endl;
    assert(sa->start_game().room() == sb->start_game().room());
    assert(sa->start_game().player_side() == pong::SIDE_LEFT);
    assert(sb->start_game().player_side() == pong::SIDE_RIGHT);
    assert(sa->start_game().opponent() == "bob" && sb->start_game().opponent() == "alice");
    assert(sa->start_game().seed() == sb->start_game().seed());
    assert(sa->start_game().rounds() == 3 && !sa->start_game().is_tournament());

    // A taken nickname is refused.
    e2e::Conn c{sched, port};
    st = co_await c.cli.connect(2s);
    assert(st == coro::net::connect_status::connected);
    ok = co_await e2e::send_msg(c.cli, e2e::join("alice", 3));
    assert(ok);
    auto err = co_await e2e::wait_for(c, pong::ServerMessage::kError, 3s);
    assert(err && err->error().code() == "name_taken");

    std::cout << "e2e_match_start OK" << std::endl;
    co_return;
}

int main()
{
    auto sched = coro::default_executor::io_executor();
    uint16_t port = 41000;
    sched->spawn(pong::net::run_listener(sched, port));
    sched->spawn(pong::mm::run_matchmaker(sched, pong::mm::MatchmakerConfig{20, 0}));
    coro::sync_wait(client_flow(sched, port));
    return 0;
}
