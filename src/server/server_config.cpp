// SPDX-License-Identifier: Apache-2.0
#include "server/server_config.hpp"

#include <yaml-cpp/yaml.h>

namespace pong {

ServerConfig load_server_config(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    ServerConfig cfg;
    if (root["listen_port"])
        cfg.listen_port = root["listen_port"].as<uint16_t>();
    if (root["metrics_port"])
        cfg.metrics_port = root["metrics_port"].as<uint16_t>();
    if (root["heartbeat_timeout_seconds"])
        cfg.heartbeat_timeout_seconds = root["heartbeat_timeout_seconds"].as<uint32_t>();
    if (root["matchmaker_poll_ms"])
        cfg.matchmaker_poll_ms = root["matchmaker_poll_ms"].as<uint32_t>();
    if (root["fixed_seed"])
        cfg.fixed_seed = root["fixed_seed"].as<uint64_t>();
    if (root["auth_mode"])
        cfg.auth_mode = root["auth_mode"].as<std::string>();
    if (root["auth_stub_prefix"])
        cfg.auth_stub_prefix = root["auth_stub_prefix"].as<std::string>();
    if (auto t = root["tournament"]) {
        if (t["min_players"])
            cfg.tournament_min_players = t["min_players"].as<uint32_t>();
        if (t["max_players"])
            cfg.tournament_max_players = t["max_players"].as<uint32_t>();
    }
    if (root["default_rounds"])
        cfg.default_rounds = root["default_rounds"].as<uint32_t>();
    if (root["log_level"])
        cfg.log_level = root["log_level"].as<std::string>();
    if (root["log_json"])
        cfg.log_json = root["log_json"].as<bool>();
    return cfg;
}

} // namespace pong
