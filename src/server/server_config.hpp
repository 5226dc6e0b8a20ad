// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>

namespace pong {

struct ServerConfig
{
    uint16_t listen_port{40001};
    uint16_t metrics_port{0}; // 0 disables
    uint32_t heartbeat_timeout_seconds{15};
    uint32_t matchmaker_poll_ms{100};
    uint64_t fixed_seed{0}; // 0 = random seed per room
    std::string auth_mode{"stub"};
    std::string auth_stub_prefix{"test_user_"};
    uint32_t tournament_min_players{3};
    uint32_t tournament_max_players{8};
    uint32_t default_rounds{3};
    std::string log_level{"info"};
    bool log_json{false};
};

// Missing keys keep their defaults. Throws YAML::Exception on unreadable
// files or values of the wrong type.
ServerConfig load_server_config(const std::string &path);

} // namespace pong
