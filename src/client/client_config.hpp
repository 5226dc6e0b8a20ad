// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "game/match_config.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace pong::client {

struct ClientConfig
{
    std::string host{"127.0.0.1"};
    uint16_t port{40001};
    std::string nickname{"player"};
    std::string token{"test_user_player"};
    uint32_t tick_hz{60};
    uint32_t heartbeat_ms{2000};
    uint32_t reconnect_timeout_ms{2000};
    float autopilot_difficulty{0.7f};
    std::string leaderboard{"log"}; // "log" or "none"
    std::string log_level{"info"};
    bool log_json{false};
    game::MatchConfig match;
};

// Top-level keys mirror the struct fields; the "match" node goes through
// game::apply_yaml. Throws YAML::Exception or game::InvalidConfig.
ClientConfig load_client_config(const std::string &path);

} // namespace pong::client
