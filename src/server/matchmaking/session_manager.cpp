// SPDX-License-Identifier: Apache-2.0
#include "server/matchmaking/session_manager.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>

namespace pong::mm {

SessionManager &instance()
{
    static SessionManager inst;
    return inst;
}

std::shared_ptr<Session> SessionManager::add_connection(coro::net::tcp::client client)
{
    std::scoped_lock lk{m_mutex};
    std::string cid = "conn_" + std::to_string(++m_connection_counter);
    auto s = std::make_shared<Session>(cid, std::move(client));
    s->last_heartbeat = std::chrono::steady_clock::now();
    m_by_connection.emplace(cid, s);
    return s;
}

bool SessionManager::register_player(const std::shared_ptr<Session> &s, std::string nickname, std::string player_id,
    std::string token)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_by_nickname.find(nickname);
    if (it != m_by_nickname.end() && it->second != s && !it->second->closed)
        return false;
    if (!s->nickname.empty() && s->nickname != nickname) {
        auto old = m_by_nickname.find(s->nickname);
        if (old != m_by_nickname.end() && old->second == s)
            m_by_nickname.erase(old);
    }
    if (!s->joined)
        metrics::relay().connected_players.fetch_add(1, std::memory_order_relaxed);
    s->joined = true;
    s->nickname = std::move(nickname);
    s->player_id = std::move(player_id);
    s->token = std::move(token);
    s->last_heartbeat = std::chrono::steady_clock::now();
    m_by_nickname[s->nickname] = s;
    return true;
}

void SessionManager::enqueue(const std::shared_ptr<Session> &s, uint32_t rounds)
{
    std::scoped_lock lk{m_mutex};
    s->rounds = rounds;
    if (!s->in_queue) {
        s->in_queue = true;
        s->last_queue_position = 0;
        s->queue_join_time = std::chrono::steady_clock::now();
        m_queue.push_back(s);
    }
    metrics::relay().queue_depth.store(m_queue.size(), std::memory_order_relaxed);
}

bool SessionManager::leave_queue(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (!s->in_queue)
        return false;
    m_queue.erase(std::remove(m_queue.begin(), m_queue.end(), s), m_queue.end());
    s->in_queue = false;
    metrics::relay().queue_depth.store(m_queue.size(), std::memory_order_relaxed);
    return true;
}

std::vector<std::shared_ptr<Session>> SessionManager::snapshot_queue()
{
    std::scoped_lock lk{m_mutex};
    return m_queue;
}

std::vector<WaitingView> SessionManager::waiting_list()
{
    std::scoped_lock lk{m_mutex};
    std::vector<WaitingView> out;
    out.reserve(m_queue.size());
    for (auto &s : m_queue)
        out.push_back({s->nickname, s->rounds});
    return out;
}

void SessionManager::pop_from_queue(const std::vector<std::shared_ptr<Session>> &sessions)
{
    std::scoped_lock lk{m_mutex};
    m_queue.erase(
        std::remove_if(
            m_queue.begin(),
            m_queue.end(),
            [&](auto &sp) { return std::find(sessions.begin(), sessions.end(), sp) != sessions.end(); }),
        m_queue.end());
    for (auto &s : sessions)
        s->in_queue = false;
    metrics::relay().queue_depth.store(m_queue.size(), std::memory_order_relaxed);
}

void SessionManager::open_room(const std::shared_ptr<Session> &left, const std::shared_ptr<Session> &right,
    const std::string &room)
{
    std::scoped_lock lk{m_mutex};
    left->room = room;
    left->side = pong::SIDE_LEFT;
    left->opponent = right;
    right->room = room;
    right->side = pong::SIDE_RIGHT;
    right->opponent = left;
    auto &rc = metrics::relay();
    rc.rooms_created.fetch_add(1, std::memory_order_relaxed);
    rc.active_rooms.fetch_add(1, std::memory_order_relaxed);
}

std::shared_ptr<Session> SessionManager::partner(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (s->room.empty())
        return nullptr;
    auto p = s->opponent.lock();
    if (!p || p->room != s->room)
        return nullptr;
    return p;
}

std::shared_ptr<Session> SessionManager::close_room_locked(const std::shared_ptr<Session> &s)
{
    if (s->room.empty())
        return nullptr;
    auto p = s->opponent.lock();
    if (p && p->room == s->room) {
        p->room.clear();
        p->opponent.reset();
    } else {
        p.reset();
    }
    s->room.clear();
    s->opponent.reset();
    metrics::gauge_dec(metrics::relay().active_rooms);
    return p;
}

std::shared_ptr<Session> SessionManager::close_room(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    return close_room_locked(s);
}

bool SessionManager::rejoin(const std::shared_ptr<Session> &s, const std::string &room, pong::Side side,
    const std::string &nickname)
{
    std::scoped_lock lk{m_mutex};
    const pong::Side other_side = side == pong::SIDE_LEFT ? pong::SIDE_RIGHT : pong::SIDE_LEFT;
    std::shared_ptr<Session> other;
    for (auto &[cid, sess] : m_by_connection) {
        if (sess == s || sess->closed || sess->room != room)
            continue;
        if (sess->side == other_side) {
            other = sess;
        } else if (sess->nickname == nickname) {
            // Previous connection of the same player still holds the seat.
            sess->replaced = true;
            sess->room.clear();
            sess->opponent.reset();
        }
    }
    if (!other)
        return false;
    s->room = room;
    s->side = side;
    s->opponent = other;
    other->opponent = s;
    if (s->nickname.empty() && !nickname.empty()) {
        s->nickname = nickname;
        m_by_nickname[nickname] = s;
    }
    metrics::relay().rejoins_accepted.fetch_add(1, std::memory_order_relaxed);
    return true;
}

std::string SessionManager::next_room_name()
{
    std::scoped_lock lk{m_mutex};
    return "game_" + std::to_string(++m_room_counter);
}

void SessionManager::push_message(const std::shared_ptr<Session> &s, const pong::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    if (s->closed)
        return;
    s->outgoing.push_back(msg);
}

void SessionManager::broadcast(const pong::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    for (auto &[cid, s] : m_by_connection)
        if (!s->closed)
            s->outgoing.push_back(msg);
}

std::vector<pong::ServerMessage> SessionManager::drain_messages(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    std::vector<pong::ServerMessage> out;
    out.swap(s->outgoing);
    return out;
}

void SessionManager::update_heartbeat(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    s->last_heartbeat = std::chrono::steady_clock::now();
}

std::vector<std::shared_ptr<Session>> SessionManager::snapshot_all_sessions()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Session>> res;
    res.reserve(m_by_connection.size());
    for (auto &kv : m_by_connection)
        res.push_back(kv.second);
    return res;
}

std::shared_ptr<Session> SessionManager::find_by_nickname(const std::string &nickname)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_by_nickname.find(nickname);
    if (it == m_by_nickname.end() || it->second->closed)
        return nullptr;
    return it->second;
}

std::shared_ptr<Session> SessionManager::disconnect_session(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (m_by_connection.erase(s->connection_id) == 0)
        return nullptr;
    s->closed = true;
    if (s->in_queue) {
        m_queue.erase(std::remove(m_queue.begin(), m_queue.end(), s), m_queue.end());
        s->in_queue = false;
        metrics::relay().queue_depth.store(m_queue.size(), std::memory_order_relaxed);
    }
    if (!s->nickname.empty()) {
        auto it = m_by_nickname.find(s->nickname);
        if (it != m_by_nickname.end() && it->second == s)
            m_by_nickname.erase(it);
    }
    if (s->joined)
        metrics::gauge_dec(metrics::relay().connected_players);
    if (s->replaced)
        return nullptr;
    auto p = close_room_locked(s);
    log::debug("[mm] disconnect {} ({}) partner={}", s->connection_id, s->nickname, p ? p->nickname : std::string());
    return p;
}

} // namespace pong::mm
