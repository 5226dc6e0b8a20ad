// SPDX-License-Identifier: Apache-2.0
#include "server/matchmaking/session_manager.hpp"
#include "server/net/listener.hpp"

#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <cassert>
#include <iostream>

int main()
{
    auto sched = coro::io_scheduler::make_shared();
    auto &mgr = pong::mm::instance();
    // Dummy tcp clients with invalid sockets; libcoro needs a scheduler.
    coro::net::tcp::client d1{sched};
    coro::net::tcp::client d2{sched};
    auto stale = mgr.add_connection(std::move(d1));
    auto peer = mgr.add_connection(std::move(d2));
    assert(mgr.register_player(stale, "stale", "p1", "tok"));
    assert(mgr.register_player(peer, "peer", "p2", "tok"));
    mgr.open_room(stale, peer, mgr.next_room_name());

    // Simulate a stale heartbeat by rewinding the timestamp.
    stale->last_heartbeat -= std::chrono::hours(1);
    const auto limit = std::chrono::seconds(15);
    std::vector<std::shared_ptr<pong::mm::Session>> expired;
    for (auto &s : mgr.snapshot_all_sessions())
        if (std::chrono::steady_clock::now() - s->last_heartbeat > limit)
            expired.push_back(s);
    assert(expired.size() == 1 && expired[0] == stale);

    // Invoke the disconnect path as the monitor would.
    pong::net::handle_disconnect(stale);
    assert(stale->closed);
    for (auto &x : mgr.snapshot_all_sessions())
        assert(x != stale);
    auto msgs = mgr.drain_messages(peer);
    bool told = false;
    for (auto &m : msgs)
        if (m.has_opponent_left())
            told = true;
    assert(told);
    assert(peer->room.empty());

    // A heartbeat refreshes the timestamp and is answered.
    peer->last_heartbeat -= std::chrono::hours(1);
    pong::ClientMessage hb;
    hb.mutable_heartbeat()->set_time_ms(1234);
    pong::net::handle_message(peer, hb);
    assert(std::chrono::steady_clock::now() - peer->last_heartbeat < limit);
    msgs = mgr.drain_messages(peer);
    assert(msgs.size() == 1 && msgs[0].heartbeat_resp().client_time_ms() == 1234);
    std::cout << "unit_heartbeat_timeout OK" << std::endl;
    return 0;
}
