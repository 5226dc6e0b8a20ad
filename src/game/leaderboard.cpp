// SPDX-License-Identifier: Apache-2.0
#include "game/leaderboard.hpp"

#include "common/logger.hpp"

#include <algorithm>

namespace pong::game {

namespace {
constexpr std::size_t kMaxNickname = 16;
}

ReportOutcome LogReporter::report(const LeaderboardEntry &entry)
{
    ReportOutcome out;
    if (entry.token.empty()) {
        out.reason = "missing token";
        log::warn("[leaderboard] rejected report for '{}': {}", entry.nickname, out.reason);
        return out;
    }
    if (entry.nickname.empty() || entry.nickname.size() > kMaxNickname) {
        out.reason = "invalid nickname";
        log::warn("[leaderboard] rejected report for '{}': {}", entry.nickname, out.reason);
        return out;
    }
    // More than half the rounds is a win; level scores are not recorded as one.
    out.winner = entry.score * 2 > entry.total_rounds;
    out.success = true;
    uint32_t wins = 0;
    {
        std::lock_guard lk(m_mutex);
        auto &w = m_wins[entry.nickname];
        if (out.winner)
            ++w;
        wins = w;
    }
    log::info("[leaderboard] {} scored {}/{} winner={} wins={}", entry.nickname, entry.score, entry.total_rounds,
        out.winner, wins);
    return out;
}

std::vector<Standing> LogReporter::standings() const
{
    std::vector<Standing> out;
    {
        std::lock_guard lk(m_mutex);
        out.reserve(m_wins.size());
        for (const auto &[name, wins] : m_wins)
            out.push_back({name, wins});
    }
    std::stable_sort(out.begin(), out.end(), [](const Standing &a, const Standing &b) { return a.wins > b.wins; });
    return out;
}

std::unique_ptr<LeaderboardReporter> make_reporter(const std::string &mode)
{
    if (mode == "none")
        return nullptr;
    if (mode != "log")
        log::warn("[leaderboard] unknown reporter '{}', using log", mode);
    return std::make_unique<LogReporter>();
}

} // namespace pong::game
