// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "pong.pb.h"

#include <coro/net/tcp/client.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pong::mm {

struct Session : public std::enable_shared_from_this<Session>
{
    std::string connection_id;
    std::string nickname; // set once join or tournament entry is accepted
    std::string player_id; // from the auth provider
    std::string token;
    bool joined{false};
    bool in_queue{false};
    uint32_t rounds{0}; // requested match length while queued
    uint32_t last_queue_position{0};
    std::string tournament_id; // empty unless enrolled

    // Room association (set when a match starts). Weak to avoid cycles.
    std::string room;
    pong::Side side{pong::SIDE_LEFT};
    std::weak_ptr<Session> opponent;
    bool replaced{false}; // a rejoin took over this seat; no opponent_left on close
    bool closed{false}; // the connection loop should drop the socket

    std::chrono::steady_clock::time_point queue_join_time{};
    std::chrono::steady_clock::time_point last_heartbeat{};

    std::unique_ptr<coro::net::tcp::client> client;
    std::vector<pong::ServerMessage> outgoing; // pending outbound messages

    Session(std::string cid, coro::net::tcp::client c)
        : connection_id(std::move(cid)), client(std::make_unique<coro::net::tcp::client>(std::move(c)))
    {}
};

struct WaitingView
{
    std::string nickname;
    uint32_t rounds{0};
};

class SessionManager
{
public:
    std::shared_ptr<Session> add_connection(coro::net::tcp::client client);
    // Claims a nickname for the session; false when another live session holds it.
    bool register_player(const std::shared_ptr<Session> &s, std::string nickname, std::string player_id,
        std::string token);
    void enqueue(const std::shared_ptr<Session> &s, uint32_t rounds);
    bool leave_queue(const std::shared_ptr<Session> &s);
    std::vector<std::shared_ptr<Session>> snapshot_queue();
    std::vector<WaitingView> waiting_list();
    void pop_from_queue(const std::vector<std::shared_ptr<Session>> &sessions);

    // Seats left and right in a room and links them as opponents.
    void open_room(const std::shared_ptr<Session> &left, const std::shared_ptr<Session> &right,
        const std::string &room);
    std::shared_ptr<Session> partner(const std::shared_ptr<Session> &s);
    // Clears the room on both members; returns the partner, if any.
    std::shared_ptr<Session> close_room(const std::shared_ptr<Session> &s);
    // Seats s in an existing room on the given side. False when the room has
    // no member on the other side.
    bool rejoin(const std::shared_ptr<Session> &s, const std::string &room, pong::Side side,
        const std::string &nickname);
    std::string next_room_name();

    void push_message(const std::shared_ptr<Session> &s, const pong::ServerMessage &msg);
    void broadcast(const pong::ServerMessage &msg);
    std::vector<pong::ServerMessage> drain_messages(const std::shared_ptr<Session> &s);
    void update_heartbeat(const std::shared_ptr<Session> &s);
    std::vector<std::shared_ptr<Session>> snapshot_all_sessions();
    std::shared_ptr<Session> find_by_nickname(const std::string &nickname);

    // Removes the session everywhere. Returns the room partner that should be
    // told about it (null when there is none or the seat was taken over), and
    // null on repeated calls.
    std::shared_ptr<Session> disconnect_session(const std::shared_ptr<Session> &s);

private:
    std::shared_ptr<Session> close_room_locked(const std::shared_ptr<Session> &s);

    std::mutex m_mutex;
    uint64_t m_connection_counter{0};
    uint64_t m_room_counter{0};
    std::unordered_map<std::string, std::shared_ptr<Session>> m_by_connection;
    std::unordered_map<std::string, std::shared_ptr<Session>> m_by_nickname;
    std::vector<std::shared_ptr<Session>> m_queue; // FIFO, oldest first
};

// Process-wide registry
SessionManager &instance();

} // namespace pong::mm
