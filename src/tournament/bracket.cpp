// SPDX-License-Identifier: Apache-2.0
#include "tournament/bracket.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace pong::tour {

namespace {

std::string match_id(uint32_t round, uint32_t slot)
{
    return "r" + std::to_string(round) + "s" + std::to_string(slot);
}

// Orders match ids by (round, slot) so earlier rounds are played first.
bool id_before(const BracketMatch &a, const BracketMatch &b)
{
    return a.round != b.round ? a.round < b.round : a.slot < b.slot;
}

// Shared by the const and mutable lookups; constness follows the rounds.
template <typename Rounds>
auto find_in(Rounds &rounds, std::string_view id) -> decltype(&rounds.front().front())
{
    for (auto &round : rounds)
        for (auto &m : round)
            if (m.id == id)
                return &m;
    return nullptr;
}

} // namespace

uint32_t bracket_size(std::size_t players)
{
    uint32_t size = 1;
    while (size < players)
        size <<= 1;
    return size;
}

std::vector<Round> generate_bracket(const std::vector<std::string> &players)
{
    if (players.size() < 2)
        throw std::invalid_argument("a tournament needs at least two players");
    std::set<std::string_view> seen;
    for (const auto &p : players) {
        if (p.empty())
            throw std::invalid_argument("player names must not be empty");
        if (!seen.insert(p).second)
            throw std::invalid_argument("duplicate player '" + p + "'");
    }

    const uint32_t size = bracket_size(players.size());
    const uint32_t byes = size - static_cast<uint32_t>(players.size());
    uint32_t round_count = 0;
    for (uint32_t s = size; s > 1; s >>= 1)
        ++round_count;

    std::vector<Round> rounds(round_count);
    uint32_t matches = size / 2;
    for (uint32_t r = 0; r < round_count; ++r, matches /= 2) {
        rounds[r].resize(matches);
        for (uint32_t s = 0; s < matches; ++s) {
            rounds[r][s].id = match_id(r + 1, s);
            rounds[r][s].round = r;
            rounds[r][s].slot = s;
        }
    }

    std::size_t next = 0;
    for (uint32_t s = 0; s < rounds[0].size(); ++s) {
        BracketMatch &m = rounds[0][s];
        if (s < byes) {
            m.player1 = players[next++];
            m.bye = true;
            m.winner = m.player1;
        } else {
            m.player1 = players[next++];
            m.player2 = players[next++];
        }
    }
    return rounds;
}

const char *to_string(RecordStatus s)
{
    switch (s) {
        case RecordStatus::ok:
            return "ok";
        case RecordStatus::unknown_match:
            return "unknown_match";
        case RecordStatus::not_ready:
            return "not_ready";
        case RecordStatus::already_recorded:
            return "already_recorded";
        case RecordStatus::invalid_winner:
            return "invalid_winner";
    }
    return "unknown";
}

Tournament::Tournament(std::string id, std::vector<std::string> players, uint32_t rounds_per_match)
    : m_id(std::move(id)), m_players(std::move(players)), m_rounds_per_match(rounds_per_match),
      m_rounds(generate_bracket(m_players))
{
    for (auto &m : m_rounds[0]) {
        if (m.bye) {
            m_completed.push_back(m.id);
            advance(m);
        } else {
            on_ready(m);
        }
    }
    log::info("[tournament {}] bracket for {} players: {} rounds, {} byes", m_id, m_players.size(), m_rounds.size(),
        bracket_size(m_players.size()) - m_players.size());
}

BracketMatch *Tournament::find_mut(std::string_view match_id)
{
    return find_in(m_rounds, match_id);
}

const BracketMatch *Tournament::find(std::string_view match_id) const
{
    return find_in(m_rounds, match_id);
}

void Tournament::on_ready(BracketMatch &m)
{
    const bool p1_gone = m_withdrawn.count(*m.player1) > 0;
    const bool p2_gone = m_withdrawn.count(*m.player2) > 0;
    if (p1_gone || p2_gone) {
        // Both gone: player1 goes through and forfeits the next one.
        const std::string &winner = p1_gone && !p2_gone ? *m.player2 : *m.player1;
        log::info("[tournament {}] {} walkover to {}", m_id, m.id, winner);
        resolve(m, winner);
        return;
    }
    auto pos = std::find_if(m_upcoming.begin(), m_upcoming.end(), [&](const std::string &id) {
        return id_before(m, *find(id));
    });
    m_upcoming.insert(pos, m.id);
}

void Tournament::resolve(BracketMatch &m, const std::string &winner)
{
    m.winner = winner;
    if (m_current && *m_current == m.id)
        m_current.reset();
    m_upcoming.erase(std::remove(m_upcoming.begin(), m_upcoming.end(), m.id), m_upcoming.end());
    m_completed.push_back(m.id);
    m_losers.push_back(*m.player1 == winner ? *m.player2 : *m.player1);
    advance(m);
}

void Tournament::advance(const BracketMatch &m)
{
    if (m.round + 1 >= m_rounds.size())
        return;
    BracketMatch &next = m_rounds[m.round + 1][m.slot / 2];
    if (m.slot % 2 == 0)
        next.player1 = m.winner;
    else
        next.player2 = m.winner;
    if (next.ready())
        on_ready(next);
}

std::optional<BracketMatch> Tournament::start_next_match()
{
    if (!m_current) {
        if (m_upcoming.empty())
            return std::nullopt;
        m_current = m_upcoming.front();
        m_upcoming.erase(m_upcoming.begin());
        const BracketMatch *m = find(*m_current);
        log::info("[tournament {}] next match {}: {} vs {}", m_id, m->id, *m->player1, *m->player2);
    }
    return *find(*m_current);
}

RecordStatus Tournament::record_result(std::string_view match_id, std::string_view winner)
{
    BracketMatch *m = find_mut(match_id);
    if (!m)
        return RecordStatus::unknown_match;
    if (m->winner)
        return RecordStatus::already_recorded;
    if (!m->ready())
        return RecordStatus::not_ready;
    if (*m->player1 != winner && *m->player2 != winner)
        return RecordStatus::invalid_winner;
    resolve(*m, std::string(winner));
    log::info("[tournament {}] {} won by {}", m_id, m->id, *m->winner);
    if (is_complete())
        log::info("[tournament {}] champion {}", m_id, champion().value_or("?"));
    return RecordStatus::ok;
}

std::vector<BracketMatch> Tournament::withdraw(std::string_view player)
{
    std::vector<BracketMatch> resolved;
    if (std::find(m_players.begin(), m_players.end(), player) == m_players.end())
        return resolved;
    if (std::find(m_losers.begin(), m_losers.end(), player) != m_losers.end())
        return resolved;
    m_withdrawn.emplace(player);

    for (auto &round : m_rounds) {
        for (auto &m : round) {
            if (m.winner || !m.ready() || !m.involves(player))
                continue;
            const std::string winner = *m.player1 == player ? *m.player2 : *m.player1;
            log::info("[tournament {}] {} withdrew, {} walkover to {}", m_id, std::string(player), m.id, winner);
            resolve(m, winner);
            resolved.push_back(m);
        }
    }
    return resolved;
}

std::optional<std::string> Tournament::champion() const
{
    const BracketMatch &final_match = m_rounds.back().front();
    return final_match.winner;
}

std::vector<BracketMatch> Tournament::completed_matches() const
{
    std::vector<BracketMatch> out;
    out.reserve(m_completed.size());
    for (const auto &id : m_completed)
        out.push_back(*find(id));
    return out;
}

std::vector<BracketMatch> Tournament::upcoming_matches() const
{
    std::vector<BracketMatch> out;
    out.reserve(m_upcoming.size());
    for (const auto &id : m_upcoming)
        out.push_back(*find(id));
    return out;
}

std::optional<BracketMatch> Tournament::current_match() const
{
    if (!m_current)
        return std::nullopt;
    return *find(*m_current);
}

std::vector<std::string> Tournament::winners() const
{
    std::vector<std::string> out;
    for (const auto &p : m_players)
        if (std::find(m_losers.begin(), m_losers.end(), p) == m_losers.end())
            out.push_back(p);
    return out;
}

} // namespace pong::tour
