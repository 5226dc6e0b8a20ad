// SPDX-License-Identifier: Apache-2.0
#include "server/tournament/tournament_service.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "tournament/snapshot_codec.hpp"

#include <algorithm>
#include <random>
#include <tuple>

namespace pong::tour {

namespace {

uint64_t room_seed(uint64_t fixed)
{
    if (fixed > 0)
        return fixed;
    static std::mt19937_64 rng(std::random_device{}());
    return rng();
}

} // namespace

const char *to_string(ServiceStatus s)
{
    switch (s) {
        case ServiceStatus::ok:
            return "ok";
        case ServiceStatus::unknown_tournament:
            return "unknown_tournament";
        case ServiceStatus::already_enrolled:
            return "already_enrolled";
        case ServiceStatus::already_started:
            return "already_started";
        case ServiceStatus::not_started:
            return "not_started";
        case ServiceStatus::full:
            return "full";
        case ServiceStatus::name_taken:
            return "name_taken";
        case ServiceStatus::not_enough_players:
            return "not_enough_players";
        case ServiceStatus::not_creator:
            return "not_creator";
        case ServiceStatus::not_member:
            return "not_member";
    }
    return "unknown";
}

TournamentService &service()
{
    static TournamentService inst;
    return inst;
}

void TournamentService::configure(ServiceConfig cfg)
{
    std::scoped_lock lk{m_mutex};
    m_cfg = cfg;
}

ServiceStatus TournamentService::create(const std::shared_ptr<mm::Session> &s, uint32_t rounds, std::string &id)
{
    std::scoped_lock lk{m_mutex};
    if (!s->tournament_id.empty())
        return ServiceStatus::already_enrolled;
    id = "t_" + std::to_string(++m_counter);
    Entry &e = m_tournaments[id];
    e.id = id;
    e.creator = s->nickname;
    e.rounds = rounds > 0 ? rounds : m_cfg.default_rounds;
    e.players.push_back(s->nickname);
    e.members[s->nickname] = s;
    s->tournament_id = id;
    log::info("[tournament {}] created by {} ({} rounds per match)", id, s->nickname, e.rounds);
    broadcast_locked(e);
    return ServiceStatus::ok;
}

ServiceStatus TournamentService::join(const std::shared_ptr<mm::Session> &s, const std::string &id)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_tournaments.find(id);
    if (it == m_tournaments.end())
        return ServiceStatus::unknown_tournament;
    Entry &e = it->second;
    if (e.bracket)
        return ServiceStatus::already_started;
    if (!s->tournament_id.empty())
        return ServiceStatus::already_enrolled;
    if (e.players.size() >= m_cfg.max_players)
        return ServiceStatus::full;
    if (std::find(e.players.begin(), e.players.end(), s->nickname) != e.players.end())
        return ServiceStatus::name_taken;
    e.players.push_back(s->nickname);
    e.members[s->nickname] = s;
    s->tournament_id = id;
    log::info("[tournament {}] {} joined ({} players)", id, s->nickname, e.players.size());
    broadcast_locked(e);
    return ServiceStatus::ok;
}

ServiceStatus TournamentService::start(const std::shared_ptr<mm::Session> &s, const std::string &id)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_tournaments.find(id);
    if (it == m_tournaments.end())
        return ServiceStatus::unknown_tournament;
    Entry &e = it->second;
    if (e.bracket)
        return ServiceStatus::already_started;
    if (e.creator != s->nickname)
        return ServiceStatus::not_creator;
    if (e.players.size() < std::max<uint32_t>(2, m_cfg.min_players))
        return ServiceStatus::not_enough_players;
    e.bracket = std::make_unique<Tournament>(e.id, e.players, e.rounds);
    metrics::relay().tournaments_active.fetch_add(1, std::memory_order_relaxed);
    launch_next_locked(e);
    broadcast_locked(e);
    retire_locked(id);
    return ServiceStatus::ok;
}

void TournamentService::launch_next_locked(Entry &e)
{
    auto &mgr = mm::instance();
    while (!e.finished && e.live_room.empty()) {
        if (e.bracket->is_complete()) {
            e.finished = true;
            metrics::gauge_dec(metrics::relay().tournaments_active);
            // Members are free to enrol again; they still get the final update.
            for (const auto &[nick, weak] : e.members)
                if (auto sess = weak.lock(); sess && sess->tournament_id == e.id)
                    sess->tournament_id.clear();
            log::info("[tournament {}] complete, champion {}", e.id, e.bracket->champion().value_or("-"));
            return;
        }
        auto m = e.bracket->start_next_match();
        if (!m)
            return;
        auto p1 = e.members.count(*m->player1) ? e.members[*m->player1].lock() : nullptr;
        auto p2 = e.members.count(*m->player2) ? e.members[*m->player2].lock() : nullptr;
        if (!p1 || p1->closed || !p2 || p2->closed) {
            // Both missing is resolved by the bracket in favour of player1.
            e.bracket->withdraw(!p1 || p1->closed ? *m->player1 : *m->player2);
            continue;
        }
        const std::string room = "tournament_" + e.id + "_" + m->id;
        mgr.open_room(p1, p2, room);
        e.live_room = room;
        const uint64_t seed = room_seed(m_cfg.fixed_seed);
        for (const auto &[self, other, side] :
            {std::tuple{p1, p2, pong::SIDE_LEFT}, std::tuple{p2, p1, pong::SIDE_RIGHT}}) {
            pong::ServerMessage smsg;
            auto *sg = smsg.mutable_start_game();
            sg->set_message("Tournament match");
            sg->set_room(room);
            sg->set_rounds(e.rounds);
            sg->set_player_side(side);
            sg->set_opponent(other->nickname);
            sg->set_is_tournament(true);
            sg->set_tournament_id(e.id);
            sg->set_match_id(m->id);
            sg->set_seed(seed);
            mgr.push_message(self, smsg);
        }
        log::info("[tournament {}] match {} in {}: {} vs {}", e.id, m->id, room, *m->player1, *m->player2);
    }
}

RecordStatus TournamentService::report(const std::shared_ptr<mm::Session> &s, const std::string &id,
    const std::string &match_id, const std::string &winner, uint32_t score)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_tournaments.find(id);
    if (it == m_tournaments.end())
        return RecordStatus::unknown_match;
    Entry &e = it->second;
    if (!e.bracket)
        return RecordStatus::not_ready;
    const auto current = e.bracket->current_match();
    const bool live = current && current->id == match_id;
    const auto st = e.bracket->record_result(match_id, winner);
    if (st != RecordStatus::ok) {
        log::debug("[tournament {}] report {} from {}: {}", id, match_id, s->nickname, to_string(st));
        return st;
    }
    if (live) {
        auto &mgr = mm::instance();
        pong::ServerMessage over;
        over.mutable_game_over()->set_winner(winner);
        over.mutable_game_over()->set_score(score);
        if (!e.live_room.empty() && s->room == e.live_room) {
            auto partner = mgr.close_room(s);
            if (partner)
                mgr.push_message(partner, over);
        }
        mgr.push_message(s, over);
        e.live_room.clear();
        launch_next_locked(e);
    } else {
        log::info("[tournament {}] {} recorded ahead of play by {}", id, match_id, s->nickname);
    }
    broadcast_locked(e);
    retire_locked(id);
    return st;
}

ServiceStatus TournamentService::leave(const std::shared_ptr<mm::Session> &s, const std::string &id)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_tournaments.find(id);
    if (it == m_tournaments.end())
        return ServiceStatus::unknown_tournament;
    if (s->tournament_id != id)
        return ServiceStatus::not_member;
    remove_player_locked(it->second, s);
    retire_locked(id);
    return ServiceStatus::ok;
}

void TournamentService::on_disconnect(const std::shared_ptr<mm::Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (s->tournament_id.empty())
        return;
    const std::string id = s->tournament_id;
    auto it = m_tournaments.find(id);
    if (it == m_tournaments.end()) {
        s->tournament_id.clear();
        return;
    }
    remove_player_locked(it->second, s);
    retire_locked(id);
}

void TournamentService::remove_player_locked(Entry &e, const std::shared_ptr<mm::Session> &s)
{
    const std::string nick = s->nickname;
    s->tournament_id.clear();
    e.members.erase(nick);
    if (!e.bracket) {
        e.players.erase(std::remove(e.players.begin(), e.players.end(), nick), e.players.end());
        if (e.creator == nick)
            e.creator = e.players.empty() ? std::string() : e.players.front();
        log::info("[tournament {}] {} left the lobby", e.id, nick);
        if (!e.players.empty())
            broadcast_locked(e);
        return;
    }
    if (e.finished)
        return;
    auto resolved = e.bracket->withdraw(nick);
    for (const auto &m : resolved) {
        if (e.live_room.empty() || s->room != e.live_room)
            continue;
        auto &mgr = mm::instance();
        if (auto partner = mgr.close_room(s)) {
            pong::ServerMessage left;
            left.mutable_opponent_left()->set_message(nick + " left the tournament");
            mgr.push_message(partner, left);
            metrics::relay().opponent_left_sent.fetch_add(1, std::memory_order_relaxed);
        }
        e.live_room.clear();
        log::info("[tournament {}] {} forfeits {}", e.id, nick, m.id);
    }
    launch_next_locked(e);
    broadcast_locked(e);
}

void TournamentService::retire_locked(const std::string &id)
{
    auto it = m_tournaments.find(id);
    if (it == m_tournaments.end())
        return;
    const Entry &e = it->second;
    if (!e.bracket && e.players.empty()) {
        log::info("[tournament {}] lobby empty, removed", id);
        m_tournaments.erase(it);
    } else if (e.finished) {
        log::debug("[tournament {}] retired", id);
        m_tournaments.erase(it);
    }
}

pong::TournamentSnapshot TournamentService::snapshot_locked(const Entry &e) const
{
    if (e.bracket)
        return to_proto(*e.bracket);
    return lobby_to_proto(e.id, e.players, e.rounds);
}

void TournamentService::broadcast_locked(const Entry &e)
{
    pong::ServerMessage smsg;
    *smsg.mutable_tournament_update()->mutable_tournament() = snapshot_locked(e);
    auto &mgr = mm::instance();
    for (const auto &[nick, weak] : e.members)
        if (auto sess = weak.lock())
            mgr.push_message(sess, smsg);
}

std::optional<pong::TournamentSnapshot> TournamentService::snapshot(const std::string &id)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_tournaments.find(id);
    if (it == m_tournaments.end())
        return std::nullopt;
    return snapshot_locked(it->second);
}

std::vector<std::string> TournamentService::tournament_ids()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::string> out;
    for (const auto &[id, e] : m_tournaments)
        out.push_back(id);
    return out;
}

void TournamentService::reset()
{
    std::scoped_lock lk{m_mutex};
    m_tournaments.clear();
    m_counter = 0;
}

} // namespace pong::tour
