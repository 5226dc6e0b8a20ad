// SPDX-License-Identifier: Apache-2.0
#include "tournament/snapshot_codec.hpp"

#include <algorithm>

namespace pong::tour {

void to_proto(const BracketMatch &m, pong::BracketMatch *out)
{
    out->set_id(m.id);
    out->set_player1(m.player1.value_or(""));
    out->set_player2(m.player2.value_or(""));
    out->set_winner(m.winner.value_or(""));
    out->set_round(m.round);
    out->set_slot(m.slot);
    out->set_bye(m.bye);
}

pong::TournamentSnapshot to_proto(const Tournament &t)
{
    pong::TournamentSnapshot snap;
    snap.set_id(t.id());
    for (const auto &p : t.players())
        snap.add_players(p);
    for (const auto &m : t.completed_matches())
        to_proto(m, snap.add_completed_matches());
    for (const auto &m : t.upcoming_matches())
        to_proto(m, snap.add_upcoming_matches());
    if (auto cur = t.current_match())
        to_proto(*cur, snap.mutable_current_match());
    for (const auto &w : t.winners())
        snap.add_winners(w);
    for (const auto &l : t.losers())
        snap.add_losers(l);
    snap.set_round_count(t.round_count());
    snap.set_champion(t.champion().value_or(""));
    snap.set_started(true);
    snap.set_rounds_per_match(t.rounds_per_match());
    return snap;
}

pong::TournamentSnapshot lobby_to_proto(const std::string &id, const std::vector<std::string> &players,
    uint32_t rounds_per_match)
{
    pong::TournamentSnapshot snap;
    snap.set_id(id);
    for (const auto &p : players) {
        snap.add_players(p);
        snap.add_winners(p);
    }
    snap.set_started(false);
    snap.set_rounds_per_match(rounds_per_match);
    return snap;
}

const char *to_string(PlayerStatus s)
{
    switch (s) {
        case PlayerStatus::not_entered:
            return "not_entered";
        case PlayerStatus::waiting:
            return "waiting";
        case PlayerStatus::playing:
            return "playing";
        case PlayerStatus::eliminated:
            return "eliminated";
        case PlayerStatus::champion:
            return "champion";
    }
    return "unknown";
}

BracketMatch from_proto(const pong::BracketMatch &m)
{
    BracketMatch out;
    out.id = m.id();
    out.round = m.round();
    out.slot = m.slot();
    out.bye = m.bye();
    if (!m.player1().empty())
        out.player1 = m.player1();
    if (!m.player2().empty())
        out.player2 = m.player2();
    if (!m.winner().empty())
        out.winner = m.winner();
    return out;
}

TournamentView view_from_proto(const pong::TournamentSnapshot &snap)
{
    TournamentView v;
    v.id = snap.id();
    v.players.assign(snap.players().begin(), snap.players().end());
    for (const auto &m : snap.completed_matches())
        v.completed.push_back(from_proto(m));
    for (const auto &m : snap.upcoming_matches())
        v.upcoming.push_back(from_proto(m));
    if (snap.has_current_match())
        v.current = from_proto(snap.current_match());
    v.winners.assign(snap.winners().begin(), snap.winners().end());
    v.losers.assign(snap.losers().begin(), snap.losers().end());
    v.round_count = snap.round_count();
    v.rounds_per_match = snap.rounds_per_match();
    if (!snap.champion().empty())
        v.champion = snap.champion();
    v.started = snap.started();
    return v;
}

PlayerStatus TournamentView::status_of(std::string_view nickname) const
{
    if (std::find(players.begin(), players.end(), nickname) == players.end())
        return PlayerStatus::not_entered;
    if (champion && *champion == nickname)
        return PlayerStatus::champion;
    if (std::find(losers.begin(), losers.end(), nickname) != losers.end())
        return PlayerStatus::eliminated;
    if (current && current->involves(nickname))
        return PlayerStatus::playing;
    return PlayerStatus::waiting;
}

} // namespace pong::tour
