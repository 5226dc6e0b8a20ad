// SPDX-License-Identifier: Apache-2.0
#include "game/match_config.hpp"

#include "common/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace pong::game {

namespace {

std::string upper(std::string_view s)
{
    std::string out(s);
    for (auto &c : out)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

bool finite_positive(float v)
{
    return std::isfinite(v) && v > 0.f;
}

void apply(const Preset &p, MatchConfig &cfg)
{
    cfg.initial_ball_speed = p.ball_speed;
    cfg.paddle_size_multiplier = static_cast<float>(p.paddle_size_pct) / 100.f;
    cfg.speed_increment = p.speed_increment;
    cfg.gravity = p.gravity;
    cfg.random_bounce = p.random_bounce;
    cfg.colors.ball = std::string(p.ball_color);
    cfg.colors.left_paddle = std::string(p.left_color);
    cfg.colors.right_paddle = std::string(p.right_color);
}

} // namespace

void MatchConfig::validate() const
{
    if (rounds == 0)
        throw InvalidConfig("rounds must be at least 1");
    if (!finite_positive(width) || !finite_positive(height))
        throw InvalidConfig("surface dimensions must be finite and positive");
    if (!finite_positive(initial_ball_speed))
        throw InvalidConfig("initial ball speed must be finite and positive");
    if (!std::isfinite(speed_increment) || speed_increment < 0.f)
        throw InvalidConfig("speed increment must be finite and non-negative");
    if (!finite_positive(paddle_speed))
        throw InvalidConfig("paddle speed must be finite and positive");
    if (!finite_positive(paddle_size_multiplier) || paddle_size_multiplier > 4.f)
        throw InvalidConfig("paddle size multiplier must be in (0, 4]");
    if (gravity && (!std::isfinite(gravity_strength) || gravity_strength < 0.f))
        throw InvalidConfig("gravity strength must be finite and non-negative");
    if (!std::isfinite(ai_difficulty) || ai_difficulty < 0.f || ai_difficulty > 1.f)
        throw InvalidConfig("ai difficulty must be in [0, 1]");
}

const std::vector<Preset> &presets()
{
    static const std::vector<Preset> table{
        {"speed", 8.f, 80, 1.0f, false, true, "#ff4500", "#ff0000", "#ff8800"},
        {"retro", 3.f, 100, 0.3f, false, false, "#ffffff", "#ffffff", "#ffffff"},
        {"giant", 5.f, 200, 0.5f, false, false, "#00ff00", "#0000ff", "#ff0000"},
        {"micro", 3.f, 50, 0.2f, false, false, "#ffff00", "#00ffff", "#ff00ff"},
        {"chaos", 7.f, 70, 1.5f, true, true, "#ff00ff", "#00ffff", "#ffff00"},
    };
    return table;
}

std::optional<MatchConfig> apply_preset(std::string_view name, MatchConfig base)
{
    auto wanted = upper(name);
    for (const auto &p : presets()) {
        if (upper(p.name) == wanted) {
            apply(p, base);
            return base;
        }
    }
    return std::nullopt;
}

std::string encode_game_code(const MatchConfig &cfg)
{
    std::string code;
    code.reserve(5);
    auto it = std::find_if(presets().begin(), presets().end(), [&](const Preset &p) {
        return p.ball_speed == cfg.initial_ball_speed;
    });
    if (it != presets().end()) {
        code.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(it->name.front()))));
    } else {
        long digit = std::lround(cfg.initial_ball_speed);
        code.push_back(static_cast<char>('0' + std::clamp(digit, 1L, 9L)));
    }
    long size_step = std::lround(cfg.paddle_size_multiplier * 100.f / 50.f);
    code.push_back(static_cast<char>('0' + std::clamp(size_step, 1L, 4L)));
    code.push_back(cfg.gravity ? 'G' : 'N');
    code.push_back(cfg.random_bounce ? 'R' : 'N');
    std::string_view color = cfg.colors.ball;
    if (!color.empty() && color.front() == '#')
        color.remove_prefix(1);
    code.push_back(color.empty() ? '0' : static_cast<char>(std::toupper(static_cast<unsigned char>(color.front()))));
    return code;
}

std::optional<MatchConfig> decode_game_code(std::string_view raw, MatchConfig base)
{
    auto code = upper(raw);
    if (code.size() == 1) {
        for (const auto &p : presets()) {
            if (static_cast<char>(std::toupper(static_cast<unsigned char>(p.name.front()))) == code[0]) {
                apply(p, base);
                return base;
            }
        }
        return std::nullopt;
    }
    if (code.size() != 5)
        return std::nullopt;
    const char speed = code[0], size = code[1], grav = code[2], bounce = code[3], color = code[4];
    if ((grav != 'G' && grav != 'N') || (bounce != 'R' && bounce != 'N'))
        return std::nullopt;

    switch (speed) {
        case 'S':
            base.initial_ball_speed = 8.f;
            break;
        case 'R':
        case 'M':
            base.initial_ball_speed = 3.f;
            break;
        case 'G':
            base.initial_ball_speed = 5.f;
            break;
        case 'C':
            base.initial_ball_speed = 7.f;
            break;
        default:
            if (speed >= '1' && speed <= '9')
                base.initial_ball_speed = static_cast<float>(speed - '0');
            else
                base.initial_ball_speed = 4.f;
    }
    if (size >= '1' && size <= '4')
        base.paddle_size_multiplier = static_cast<float>(size - '0') * 0.5f;
    else
        base.paddle_size_multiplier = 1.f;
    base.gravity = grav == 'G';
    base.random_bounce = bounce == 'R';
    switch (color) {
        case 'F':
            base.colors.ball = "#ff4500";
            break;
        case 'B':
            base.colors.ball = "#0000ff";
            break;
        case 'G':
            base.colors.ball = "#00ff00";
            break;
        case 'W':
            base.colors.ball = "#ffffff";
            break;
        case 'Y':
            base.colors.ball = "#ffff00";
            break;
        default:
            base.colors.ball = "#00d4ff";
    }
    return base;
}

std::string_view to_string(ServePolicy p)
{
    switch (p) {
        case ServePolicy::random:
            return "random";
        case ServePolicy::toward_conceder:
            return "toward_conceder";
    }
    return "random";
}

std::optional<ServePolicy> parse_serve_policy(std::string_view s)
{
    if (s == "random")
        return ServePolicy::random;
    if (s == "toward_conceder")
        return ServePolicy::toward_conceder;
    return std::nullopt;
}

void apply_yaml(MatchConfig &cfg, const YAML::Node &node)
{
    if (!node || !node.IsMap())
        return;
    // Preset and game code first so explicit keys below can refine them.
    if (node["preset"]) {
        auto name = node["preset"].as<std::string>();
        if (auto p = apply_preset(name, cfg))
            cfg = *p;
        else
            throw InvalidConfig("unknown preset '" + name + "'");
    }
    if (node["game_code"]) {
        auto code = node["game_code"].as<std::string>();
        if (auto c = decode_game_code(code, cfg))
            cfg = *c;
        else
            throw InvalidConfig("invalid game code '" + code + "'");
    }
    if (node["rounds"])
        cfg.rounds = node["rounds"].as<uint32_t>();
    if (node["ball_speed"])
        cfg.initial_ball_speed = node["ball_speed"].as<float>();
    if (node["speed_increment"])
        cfg.speed_increment = node["speed_increment"].as<float>();
    if (node["paddle_speed"])
        cfg.paddle_speed = node["paddle_speed"].as<float>();
    if (node["paddle_size"])
        cfg.paddle_size_multiplier = node["paddle_size"].as<float>() / 100.f;
    if (node["gravity"])
        cfg.gravity = node["gravity"].as<bool>();
    if (node["gravity_strength"])
        cfg.gravity_strength = node["gravity_strength"].as<float>();
    if (node["random_bounce"])
        cfg.random_bounce = node["random_bounce"].as<bool>();
    if (node["width"])
        cfg.width = node["width"].as<float>();
    if (node["height"])
        cfg.height = node["height"].as<float>();
    if (node["fullscreen"])
        cfg.fullscreen = node["fullscreen"].as<bool>();
    if (node["ai_difficulty"])
        cfg.ai_difficulty = node["ai_difficulty"].as<float>();
    if (node["serve"]) {
        auto s = node["serve"].as<std::string>();
        auto p = parse_serve_policy(s);
        if (!p)
            throw InvalidConfig("unknown serve policy '" + s + "'");
        cfg.serve = *p;
    }
    if (node["seed"])
        cfg.seed = node["seed"].as<uint64_t>();
    if (auto colors = node["colors"]) {
        if (colors["ball"])
            cfg.colors.ball = colors["ball"].as<std::string>();
        if (colors["left_paddle"])
            cfg.colors.left_paddle = colors["left_paddle"].as<std::string>();
        if (colors["right_paddle"])
            cfg.colors.right_paddle = colors["right_paddle"].as<std::string>();
    }
    log::debug(
        "[config] match rounds={} speed={} inc={} paddle={} gravity={} bounce={} serve={}",
        cfg.rounds,
        cfg.initial_ball_speed,
        cfg.speed_increment,
        cfg.paddle_size_multiplier,
        cfg.gravity,
        cfg.random_bounce,
        to_string(cfg.serve));
}

} // namespace pong::game
