// SPDX-License-Identifier: Apache-2.0
// tournament_service.hpp - relay side of tournament play: enrolment lobby,
// bracket ownership, seating each match in a room and fanning out
// tournament_update snapshots. Lock order: service, then SessionManager.
#pragma once
#include "server/matchmaking/session_manager.hpp"
#include "tournament/bracket.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pong::tour {

struct ServiceConfig
{
    uint32_t min_players{3};
    uint32_t max_players{8};
    uint32_t default_rounds{3};
    uint64_t fixed_seed{0};
};

enum class ServiceStatus : uint8_t
{
    ok,
    unknown_tournament,
    already_enrolled,
    already_started,
    not_started,
    full,
    name_taken,
    not_enough_players,
    not_creator,
    not_member
};

const char *to_string(ServiceStatus s);

class TournamentService
{
public:
    void configure(ServiceConfig cfg);
    const ServiceConfig &config() const { return m_cfg; }

    // Creator is enrolled as the first player. On ok, id receives the new id.
    ServiceStatus create(const std::shared_ptr<mm::Session> &s, uint32_t rounds, std::string &id);
    ServiceStatus join(const std::shared_ptr<mm::Session> &s, const std::string &id);
    ServiceStatus start(const std::shared_ptr<mm::Session> &s, const std::string &id);
    // Result of the match the session played. The first report for a match
    // wins; later ones come back as already_recorded.
    RecordStatus report(const std::shared_ptr<mm::Session> &s, const std::string &id, const std::string &match_id,
        const std::string &winner, uint32_t score);
    ServiceStatus leave(const std::shared_ptr<mm::Session> &s, const std::string &id);
    // Connection gone: same as leave for whatever tournament the session is in.
    void on_disconnect(const std::shared_ptr<mm::Session> &s);

    std::optional<pong::TournamentSnapshot> snapshot(const std::string &id);
    std::vector<std::string> tournament_ids();

    // Drops all state (tests).
    void reset();

private:
    struct Entry
    {
        std::string id;
        std::string creator;
        uint32_t rounds{3};
        std::vector<std::string> players;
        std::map<std::string, std::weak_ptr<mm::Session>> members;
        std::unique_ptr<Tournament> bracket;
        std::string live_room; // room of the current match
        bool finished{false};
    };

    pong::TournamentSnapshot snapshot_locked(const Entry &e) const;
    void broadcast_locked(const Entry &e);
    void launch_next_locked(Entry &e);
    void remove_player_locked(Entry &e, const std::shared_ptr<mm::Session> &s);
    // Erases empty lobbies and finished tournaments.
    void retire_locked(const std::string &id);

    ServiceConfig m_cfg;
    std::mutex m_mutex;
    uint64_t m_counter{0};
    std::map<std::string, Entry> m_tournaments;
};

TournamentService &service();

} // namespace pong::tour
