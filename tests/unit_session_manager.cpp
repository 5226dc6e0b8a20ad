// SPDX-License-Identifier: Apache-2.0
#include "server/matchmaking/session_manager.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <cassert>
#include <iostream>

int main()
{
    auto scheduler = coro::default_executor::io_executor();
    // Create dummy connections
    coro::net::tcp::client c1{scheduler};
    coro::net::tcp::client c2{scheduler};
    coro::net::tcp::client c3{scheduler};
    auto &mgr = pong::mm::instance();
    auto s1 = mgr.add_connection(std::move(c1));
    auto s2 = mgr.add_connection(std::move(c2));
    auto s3 = mgr.add_connection(std::move(c3));
    assert(s1->connection_id != s2->connection_id);

    assert(mgr.register_player(s1, "alice", "p_alice", "tok"));
    assert(mgr.register_player(s2, "bob", "p_bob", "tok"));
    // Nickname held by a live session.
    assert(!mgr.register_player(s3, "alice", "p_alice", "tok"));
    assert(mgr.find_by_nickname("alice") == s1);

    mgr.enqueue(s1, 3);
    mgr.enqueue(s2, 5);
    auto snap = mgr.snapshot_queue();
    assert(snap.size() == 2 && snap[0] == s1 && snap[1] == s2);
    auto waiting = mgr.waiting_list();
    assert(waiting.size() == 2 && waiting[0].nickname == "alice" && waiting[1].rounds == 5);

    mgr.pop_from_queue({s1});
    auto snap2 = mgr.snapshot_queue();
    bool s1_present = false, s2_present = false;
    for (auto &s : snap2) {
        if (s == s1)
            s1_present = true;
        if (s == s2)
            s2_present = true;
    }
    assert(!s1_present && s2_present);
    assert(mgr.leave_queue(s2));
    assert(!mgr.leave_queue(s2));
    assert(mgr.snapshot_queue().empty());

    // Room pairing and the message queues.
    const auto room = mgr.next_room_name();
    mgr.open_room(s1, s2, room);
    assert(s1->room == room && s2->side == pong::SIDE_RIGHT);
    assert(mgr.partner(s1) == s2 && mgr.partner(s2) == s1);
    pong::ServerMessage hello;
    hello.mutable_queue_update()->set_message("hi");
    mgr.push_message(s2, hello);
    auto drained = mgr.drain_messages(s2);
    assert(drained.size() == 1 && drained[0].has_queue_update());
    assert(mgr.drain_messages(s2).empty());

    // A new connection of bob takes over his seat; the old one leaves quietly.
    assert(mgr.register_player(s3, "carol", "p_carol", "tok"));
    coro::net::tcp::client c4{scheduler};
    auto s4 = mgr.add_connection(std::move(c4));
    assert(mgr.rejoin(s4, room, pong::SIDE_RIGHT, "bob"));
    assert(s2->replaced && s2->room.empty());
    assert(mgr.partner(s1) == s4);
    assert(mgr.disconnect_session(s2) == nullptr);
    assert(!mgr.rejoin(s3, "game_missing", pong::SIDE_LEFT, "carol"));

    // Leaving for real tells the partner exactly once.
    assert(mgr.disconnect_session(s4) == s1);
    assert(s1->room.empty());
    assert(mgr.disconnect_session(s4) == nullptr);
    // Closed sessions release their nickname.
    mgr.disconnect_session(s1);
    coro::net::tcp::client c5{scheduler};
    auto s5 = mgr.add_connection(std::move(c5));
    assert(mgr.register_player(s5, "alice", "p_alice", "tok"));
    std::cout << "unit_session_manager OK" << std::endl;
    return 0;
}
