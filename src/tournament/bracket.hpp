// SPDX-License-Identifier: Apache-2.0
// bracket.hpp - single elimination bracket and the match sequencing on top
// of it. Not thread safe; the relay's TournamentService serialises access.
#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace pong::tour {

struct BracketMatch
{
    std::string id; // "r<round + 1>s<slot>"
    uint32_t round{0};
    uint32_t slot{0};
    std::optional<std::string> player1;
    std::optional<std::string> player2;
    std::optional<std::string> winner;
    bool bye{false}; // player1 advances without playing

    bool ready() const { return !bye && player1 && player2; }
    bool involves(std::string_view nickname) const
    {
        return (player1 && *player1 == nickname) || (player2 && *player2 == nickname);
    }
};

using Round = std::vector<BracketMatch>;

// First round plus empty placeholder rounds up to the final. Bracket size is
// the next power of two; entrants 0..b-1 receive the b byes in slots 0..b-1
// and the rest pair up in enrollment order. Bye matches come back already
// resolved. Throws std::invalid_argument for fewer than two entrants or
// duplicate names.
std::vector<Round> generate_bracket(const std::vector<std::string> &players);

uint32_t bracket_size(std::size_t players);

enum class RecordStatus : uint8_t
{
    ok,
    unknown_match,
    not_ready,
    already_recorded,
    invalid_winner
};

const char *to_string(RecordStatus s);

class Tournament
{
public:
    Tournament(std::string id, std::vector<std::string> players, uint32_t rounds_per_match = 3);

    // Promotes the first upcoming match to current. Returns the current match
    // (existing or newly promoted), nullopt when nothing is left to play.
    std::optional<BracketMatch> start_next_match();

    RecordStatus record_result(std::string_view match_id, std::string_view winner);

    // Player left: their pending match becomes a walkover for the opponent
    // now, or as soon as the opponent is known. Returns matches resolved now.
    std::vector<BracketMatch> withdraw(std::string_view player);

    bool is_complete() const { return !m_current && m_upcoming.empty(); }
    std::optional<std::string> champion() const;

    std::vector<BracketMatch> completed_matches() const;
    std::vector<BracketMatch> upcoming_matches() const;
    std::optional<BracketMatch> current_match() const;
    // Players not yet eliminated, in enrollment order.
    std::vector<std::string> winners() const;
    // Eliminated players, in elimination order.
    const std::vector<std::string> &losers() const { return m_losers; }

    const BracketMatch *find(std::string_view match_id) const;
    const std::string &id() const { return m_id; }
    const std::vector<std::string> &players() const { return m_players; }
    const std::vector<Round> &rounds() const { return m_rounds; }
    uint32_t round_count() const { return static_cast<uint32_t>(m_rounds.size()); }
    uint32_t rounds_per_match() const { return m_rounds_per_match; }

private:
    BracketMatch *find_mut(std::string_view match_id);
    void resolve(BracketMatch &m, const std::string &winner);
    void advance(const BracketMatch &m);
    void on_ready(BracketMatch &m);

    std::string m_id;
    std::vector<std::string> m_players;
    uint32_t m_rounds_per_match;
    std::vector<Round> m_rounds;
    std::vector<std::string> m_completed;
    std::vector<std::string> m_upcoming;
    std::optional<std::string> m_current;
    std::vector<std::string> m_losers;
    std::set<std::string, std::less<>> m_withdrawn;
};

} // namespace pong::tour
