// SPDX-License-Identifier: Apache-2.0
// match_config.hpp - immutable per-match tuning: defaults, named presets,
// five character game codes and YAML overrides.
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace YAML {
class Node;
}

namespace pong::game {

class InvalidConfig : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

enum class ServePolicy
{
    random, // fair coin every serve
    toward_conceder // serve toward the side that was just scored on
};

struct Colors
{
    std::string ball{"#00d4ff"};
    std::string left_paddle{"#007bff"};
    std::string right_paddle{"#ff758c"};
};

struct MatchConfig
{
    uint32_t rounds{3};
    float initial_ball_speed{4.f};
    float speed_increment{0.5f};
    float paddle_speed{4.5f};
    float paddle_size_multiplier{1.f}; // 1.0 == 100 %
    bool gravity{false};
    float gravity_strength{0.1f};
    bool random_bounce{false};
    Colors colors;
    float width{800.f};
    float height{400.f};
    bool fullscreen{false};
    float ai_difficulty{0.7f};
    ServePolicy serve{ServePolicy::random};
    uint64_t seed{0}; // 0 = draw from std::random_device at match start

    // Throws InvalidConfig describing the first offending field.
    void validate() const;
};

struct Preset
{
    std::string_view name;
    float ball_speed;
    uint32_t paddle_size_pct;
    float speed_increment;
    bool gravity;
    bool random_bounce;
    std::string_view ball_color;
    std::string_view left_color;
    std::string_view right_color;
};

const std::vector<Preset> &presets();

// Applies a named preset (case-insensitive) on top of base.
std::optional<MatchConfig> apply_preset(std::string_view name, MatchConfig base = {});

// Code layout: speed, paddle size / 50, G|N gravity, R|N random bounce, ball
// colour initial. A single preset initial ("S", "R", ...) selects that preset.
std::string encode_game_code(const MatchConfig &cfg);
std::optional<MatchConfig> decode_game_code(std::string_view code, MatchConfig base = {});

std::string_view to_string(ServePolicy p);
std::optional<ServePolicy> parse_serve_policy(std::string_view s);

// Overlays keys present in node onto cfg; yaml-cpp conversion errors propagate.
// Recognised: preset, game_code, rounds, ball_speed, speed_increment,
// paddle_speed, paddle_size (percent), gravity, gravity_strength,
// random_bounce, width, height, fullscreen, ai_difficulty, serve, seed,
// colors.{ball,left_paddle,right_paddle}.
void apply_yaml(MatchConfig &cfg, const YAML::Node &node);

} // namespace pong::game
