// SPDX-License-Identifier: Apache-2.0
// leaderboard.hpp
// Match results leave the core through this interface; storage lives behind
// it (the shipped reporter only logs and keeps an in-process wins table).
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pong::game {

struct LeaderboardEntry
{
    std::string nickname;
    std::string token;
    uint32_t score{0};
    uint32_t total_rounds{0};
};

struct ReportOutcome
{
    bool success{false};
    bool winner{false}; // entry won the match it reported
    std::string reason; // filled when !success
};

class LeaderboardReporter
{
public:
    virtual ~LeaderboardReporter() = default;
    virtual ReportOutcome report(const LeaderboardEntry &entry) = 0;
};

struct Standing
{
    std::string nickname;
    uint32_t wins{0};
};

class LogReporter : public LeaderboardReporter
{
public:
    ReportOutcome report(const LeaderboardEntry &entry) override;

    // Sorted by wins, most first; ties by name.
    std::vector<Standing> standings() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, uint32_t> m_wins;
};

// "log" (default) or "none"; nullptr for "none".
std::unique_ptr<LeaderboardReporter> make_reporter(const std::string &mode);

} // namespace pong::game
