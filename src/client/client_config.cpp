// SPDX-License-Identifier: Apache-2.0
#include "client/client_config.hpp"

#include <yaml-cpp/yaml.h>

namespace pong::client {

ClientConfig load_client_config(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    ClientConfig cfg;
    if (root["host"])
        cfg.host = root["host"].as<std::string>();
    if (root["port"])
        cfg.port = root["port"].as<uint16_t>();
    if (root["nickname"])
        cfg.nickname = root["nickname"].as<std::string>();
    if (root["token"])
        cfg.token = root["token"].as<std::string>();
    if (root["tick_hz"])
        cfg.tick_hz = root["tick_hz"].as<uint32_t>();
    if (root["heartbeat_ms"])
        cfg.heartbeat_ms = root["heartbeat_ms"].as<uint32_t>();
    if (root["reconnect_timeout_ms"])
        cfg.reconnect_timeout_ms = root["reconnect_timeout_ms"].as<uint32_t>();
    if (root["autopilot_difficulty"])
        cfg.autopilot_difficulty = root["autopilot_difficulty"].as<float>();
    if (root["leaderboard"])
        cfg.leaderboard = root["leaderboard"].as<std::string>();
    if (root["log_level"])
        cfg.log_level = root["log_level"].as<std::string>();
    if (root["log_json"])
        cfg.log_json = root["log_json"].as<bool>();
    if (root["match"])
        game::apply_yaml(cfg.match, root["match"]);
    if (cfg.tick_hz == 0)
        cfg.tick_hz = 60;
    cfg.match.validate();
    return cfg;
}

} // namespace pong::client
