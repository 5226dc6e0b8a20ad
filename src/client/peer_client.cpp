// SPDX-License-Identifier: Apache-2.0
// pong_client: headless peer. Plays a local match against the AI, a queued
// match through the relay, or a whole tournament, with the autopilot on the
// local paddle.
#include "client/client_config.hpp"
#include "client/match_runner.hpp"
#include "client/relay_link.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "game/leaderboard.hpp"
#include "game/match_session.hpp"
#include "tournament/snapshot_codec.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <optional>
#include <random>
#include <string>
#include <thread>

#ifndef PONG_VERSION
#define PONG_VERSION "dev"
#endif

using namespace std::chrono_literals;

namespace {

std::atomic_bool g_stop{false};

void handle_signal(int)
{
    g_stop.store(true);
}

enum class Mode
{
    single,
    queue,
    tournament
};

struct Options
{
    Mode mode{Mode::queue};
    std::string tournament_id; // join this one
    bool tournament_create{false};
    uint32_t start_at{0}; // creator starts once this many players are enrolled
    int duration_sec{0};
    bool realtime{true};
};

uint64_t session_id()
{
    static std::mt19937_64 rng(std::random_device{}());
    return rng();
}

void log_result(const pong::game::MatchResult &res, const std::string &nickname)
{
    auto winner = res.winner();
    pong::log::info("[client] {} match over ({}): {}-{} after {} rounds, {}", nickname, pong::game::to_string(res.reason),
        res.left_score, res.right_score, res.rounds_played,
        winner ? (*winner == res.local_side ? "won" : "lost") : "no result");
}

coro::task<int> queue_flow(std::shared_ptr<coro::io_scheduler> scheduler, pong::client::ClientConfig cfg,
    pong::game::LeaderboardReporter *reporter)
{
    co_await scheduler->schedule();
    pong::client::RelayLink link{scheduler, cfg.host, cfg.port};
    if (!co_await link.connect(2s))
        co_return 1;
    pong::client::MatchRunner runner{scheduler, link,
        {cfg.tick_hz, std::chrono::milliseconds(cfg.heartbeat_ms), std::chrono::milliseconds(cfg.reconnect_timeout_ms)}};
    const pong::game::PlayerIdentity who{cfg.nickname, cfg.token};
    pong::game::MatchSession session{cfg.match, who, session_id()};
    session.enable_autopilot(cfg.autopilot_difficulty);
    session.enqueue();
    co_await runner.run(session, g_stop);
    if (!session.result()) {
        pong::log::warn("[client] left before a match started: {}", session.last_error());
        co_return 1;
    }
    log_result(*session.result(), cfg.nickname);
    pong::client::publish_result(*session.result(), who, reporter);
    co_return 0;
}

coro::task<int> tournament_flow(std::shared_ptr<coro::io_scheduler> scheduler, pong::client::ClientConfig cfg,
    Options opt)
{
    co_await scheduler->schedule();
    pong::client::RelayLink link{scheduler, cfg.host, cfg.port};
    if (!co_await link.connect(2s))
        co_return 1;
    pong::client::MatchRunner runner{scheduler, link,
        {cfg.tick_hz, std::chrono::milliseconds(cfg.heartbeat_ms), std::chrono::milliseconds(cfg.reconnect_timeout_ms)}};
    const pong::game::PlayerIdentity who{cfg.nickname, cfg.token};

    pong::ClientMessage entry;
    if (opt.tournament_create) {
        auto *tc = entry.mutable_tournament_create();
        tc->set_nickname(cfg.nickname);
        tc->set_token(cfg.token);
        tc->set_rounds(cfg.match.rounds);
    } else {
        auto *tj = entry.mutable_tournament_join();
        tj->set_tournament_id(opt.tournament_id);
        tj->set_nickname(cfg.nickname);
        tj->set_token(cfg.token);
    }
    if (!co_await link.send(entry)) {
        pong::log::error("[client] could not reach the relay");
        co_return 1;
    }

    std::optional<pong::tour::TournamentView> view;
    bool start_sent = false;
    while (!g_stop.load()) {
        auto msgs = co_await runner.pump(100ms);
        if (!msgs) {
            pong::log::error("[client] relay connection lost");
            co_return 1;
        }
        for (auto &msg : *msgs) {
            if (msg.has_error()) {
                pong::log::warn("[client] relay error {}: {}", msg.error().code(), msg.error().message());
                if (!view)
                    co_return 1;
            } else if (msg.has_tournament_update()) {
                view = pong::tour::view_from_proto(msg.tournament_update().tournament());
                pong::log::info("[client] tournament {} players={} started={} you are {}", view->id,
                    view->players.size(), view->started, pong::tour::to_string(view->status_of(cfg.nickname)));
                if (opt.tournament_create && !view->started && !start_sent && opt.start_at > 0
                    && view->players.size() >= opt.start_at) {
                    pong::ClientMessage start;
                    start.mutable_tournament_start()->set_tournament_id(view->id);
                    start_sent = co_await link.send(start);
                }
            } else if (msg.has_start_game() && msg.start_game().is_tournament()) {
                pong::game::MatchSession session{cfg.match, who, session_id()};
                session.enable_autopilot(cfg.autopilot_difficulty);
                session.on_message(msg);
                co_await runner.run(session, g_stop);
                if (session.result())
                    log_result(*session.result(), cfg.nickname);
            }
        }
        if (view) {
            const auto status = view->status_of(cfg.nickname);
            if (status == pong::tour::PlayerStatus::champion) {
                pong::log::info("[client] {} won tournament {}", cfg.nickname, view->id);
                co_return 0;
            }
            if (status == pong::tour::PlayerStatus::eliminated && view->complete()) {
                pong::log::info("[client] tournament {} over, champion {}", view->id, view->champion.value_or("-"));
                co_return 0;
            }
        }
    }
    co_return 0;
}

} // namespace

int main(int argc, char **argv)
{
    std::string config_path = "config/client.yaml";
    Options opt;
    std::optional<std::string> host, nickname, preset, code;
    std::optional<uint16_t> port;
    std::optional<uint32_t> rounds;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 < argc)
                return std::string(argv[++i]);
            pong::log::warn("Missing value for {}", a);
            return std::nullopt;
        };
        try {
            if (a == "--single") {
                opt.mode = Mode::single;
            } else if (a == "--fast") {
                opt.realtime = false;
            } else if (a == "--host") {
                host = next();
            } else if (a == "--port") {
                if (auto v = next())
                    port = static_cast<uint16_t>(std::stoi(*v));
            } else if (a == "--nickname") {
                nickname = next();
            } else if (a == "--rounds") {
                if (auto v = next())
                    rounds = static_cast<uint32_t>(std::stoul(*v));
            } else if (a == "--preset") {
                preset = next();
            } else if (a == "--code") {
                code = next();
            } else if (a == "--tournament-create") {
                opt.mode = Mode::tournament;
                opt.tournament_create = true;
            } else if (a == "--tournament-join") {
                opt.mode = Mode::tournament;
                if (auto v = next())
                    opt.tournament_id = *v;
            } else if (a == "--tournament-start") {
                if (auto v = next())
                    opt.start_at = static_cast<uint32_t>(std::stoul(*v));
            } else if (a == "--duration") {
                if (auto v = next())
                    opt.duration_sec = std::stoi(*v);
            } else if (!a.empty() && a[0] != '-') {
                config_path = a;
            }
        } catch (const std::exception &) {
            pong::log::warn("Invalid value for {} ignored", a);
        }
    }

    pong::client::ClientConfig cfg;
    try {
        cfg = pong::client::load_client_config(config_path);
    } catch (const YAML::BadFile &) {
        pong::log::info("No config at {}, using defaults", config_path);
    } catch (const YAML::Exception &ex) {
        pong::log::error("Failed to load config {}: {}", config_path, ex.what());
        return 1;
    } catch (const pong::game::InvalidConfig &ex) {
        pong::log::error("Invalid match settings in {}: {}", config_path, ex.what());
        return 1;
    }
    if (host)
        cfg.host = *host;
    if (port)
        cfg.port = *port;
    if (nickname) {
        cfg.nickname = *nickname;
        cfg.token = "test_user_" + *nickname;
    }
    if (preset) {
        auto p = pong::game::apply_preset(*preset, cfg.match);
        if (!p) {
            pong::log::error("Unknown preset '{}'", *preset);
            return 1;
        }
        cfg.match = *p;
    }
    if (code) {
        auto c = pong::game::decode_game_code(*code, cfg.match);
        if (!c) {
            pong::log::error("Invalid game code '{}'", *code);
            return 1;
        }
        cfg.match = *c;
    }
    if (rounds)
        cfg.match.rounds = *rounds;
    try {
        cfg.match.validate();
    } catch (const pong::game::InvalidConfig &ex) {
        pong::log::error("Invalid match settings: {}", ex.what());
        return 1;
    }

    if (!cfg.log_level.empty() && std::getenv("PONG_LOG_LEVEL") == nullptr)
        setenv("PONG_LOG_LEVEL", cfg.log_level.c_str(), 1);
    if (cfg.log_json)
        setenv("PONG_LOG_JSON", "1", 1);
    pong::log::set_app_id("pong_client");
    pong::log::init();
    // Argument warnings may have started the logger before the env was set.
    if (const char *lvl = std::getenv("PONG_LOG_LEVEL"))
        pong::log::set_level(lvl);
    if (cfg.log_json)
        pong::log::set_json(true);
    pong::log::info("pong client {} {} (code {})", PONG_VERSION, cfg.nickname,
        pong::game::encode_game_code(cfg.match));

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::thread watchdog;
    if (opt.duration_sec > 0) {
        watchdog = std::thread([secs = opt.duration_sec] {
            auto until = std::chrono::steady_clock::now() + std::chrono::seconds(secs);
            while (!g_stop.load() && std::chrono::steady_clock::now() < until)
                std::this_thread::sleep_for(100ms);
            g_stop.store(true);
        });
    }

    auto reporter = pong::game::make_reporter(cfg.leaderboard);
    int rc = 0;
    if (opt.mode == Mode::single) {
        const pong::game::PlayerIdentity who{cfg.nickname, cfg.token};
        pong::game::MatchSession session{cfg.match, who, session_id()};
        session.enable_autopilot(cfg.autopilot_difficulty);
        auto res = pong::client::run_local(session, cfg.tick_hz, g_stop, opt.realtime);
        log_result(res, cfg.nickname);
        pong::client::publish_result(res, who, reporter.get());
    } else {
        auto scheduler = coro::default_executor::io_executor();
        if (opt.mode == Mode::queue)
            rc = coro::sync_wait(queue_flow(scheduler, cfg, reporter.get()));
        else
            rc = coro::sync_wait(tournament_flow(scheduler, cfg, opt));
    }
    g_stop.store(true);
    if (watchdog.joinable())
        watchdog.join();

    auto &mc = pong::metrics::match();
    auto &sc = pong::metrics::sync();
    pong::log::info("{\"metric\":\"client_final\",\"rounds\":{},\"tick_p99_ns\":{},\"snapshots_sent\":{},"
                    "\"hard_snaps\":{},\"blends\":{},\"desyncs\":{}}",
        mc.rounds_completed.load(), pong::metrics::approx_tick_p99(), sc.snapshots_sent.load(), sc.hard_snaps.load(),
        sc.blends.load(), sc.desyncs.load());
    pong::log::flush();
    return rc;
}
