// SPDX-License-Identifier: Apache-2.0
// snapshot_codec.hpp - wholesale tournament state for tournament_update.
// The relay encodes after every change; clients decode the whole snapshot
// and derive their own standing from it.
#pragma once
#include "tournament/bracket.hpp"

#include "pong.pb.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pong::tour {

void to_proto(const BracketMatch &m, pong::BracketMatch *out);
pong::TournamentSnapshot to_proto(const Tournament &t);
// Enrolment phase, before the bracket exists.
pong::TournamentSnapshot lobby_to_proto(const std::string &id, const std::vector<std::string> &players,
    uint32_t rounds_per_match);

enum class PlayerStatus : uint8_t
{
    not_entered,
    waiting,
    playing,
    eliminated,
    champion
};

const char *to_string(PlayerStatus s);

struct TournamentView
{
    std::string id;
    std::vector<std::string> players;
    std::vector<BracketMatch> completed;
    std::vector<BracketMatch> upcoming;
    std::optional<BracketMatch> current;
    std::vector<std::string> winners;
    std::vector<std::string> losers;
    uint32_t round_count{0};
    uint32_t rounds_per_match{0};
    std::optional<std::string> champion;
    bool started{false};

    bool complete() const { return started && !current && upcoming.empty(); }
    PlayerStatus status_of(std::string_view nickname) const;
};

BracketMatch from_proto(const pong::BracketMatch &m);
TournamentView view_from_proto(const pong::TournamentSnapshot &snap);

} // namespace pong::tour
