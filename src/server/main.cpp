// SPDX-License-Identifier: Apache-2.0
// pong_relay: matchmaking and message relay for networked pong matches. The
// relay never simulates; it pairs players, runs tournament brackets and
// forwards game_update payloads between the two members of a room.
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/auth/auth_provider.hpp"
#include "server/matchmaking/matchmaker.hpp"
#include "server/matchmaking/session_manager.hpp"
#include "server/net/listener.hpp"
#include "server/net/metrics_http.hpp"
#include "server/server_config.hpp"
#include "server/tournament/tournament_service.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#ifndef PONG_VERSION
#define PONG_VERSION "dev"
#endif

namespace pong {
std::atomic_bool g_shutdown{false};
}

static coro::task<void> heartbeat_monitor(std::shared_ptr<coro::io_scheduler> sched, uint32_t timeout_sec)
{
    co_await sched->schedule();
    using clock = std::chrono::steady_clock;
    while (!pong::g_shutdown.load()) {
        auto now = clock::now();
        for (auto &s : pong::mm::instance().snapshot_all_sessions()) {
            if (s->closed || s->last_heartbeat.time_since_epoch().count() == 0)
                continue;
            auto diff = std::chrono::duration_cast<std::chrono::seconds>(now - s->last_heartbeat).count();
            if (diff > timeout_sec) {
                pong::log::warn("[hb] disconnect timeout conn={} nick={} diff={}s", s->connection_id, s->nickname,
                    diff);
                pong::metrics::relay().heartbeat_timeouts.fetch_add(1, std::memory_order_relaxed);
                pong::net::handle_disconnect(s);
            }
        }
        co_await sched->yield_for(std::chrono::seconds(1));
    }
}

static std::string metrics_json(const char *tag)
{
    auto &rc = pong::metrics::relay();
    std::ostringstream j;
    j << "{\"metric\":\"" << tag << "\"";
    j << ",\"connected_players\":" << rc.connected_players.load();
    j << ",\"queue_depth\":" << rc.queue_depth.load();
    j << ",\"active_rooms\":" << rc.active_rooms.load();
    j << ",\"rooms_created\":" << rc.rooms_created.load();
    j << ",\"tournaments_active\":" << rc.tournaments_active.load();
    j << ",\"game_updates_relayed\":" << rc.game_updates_relayed.load();
    j << ",\"game_updates_dropped\":" << rc.game_updates_dropped.load();
    j << ",\"auth_failures\":" << rc.auth_failures.load();
    j << ",\"malformed_frames\":" << rc.malformed_frames.load();
    j << ",\"heartbeat_timeouts\":" << rc.heartbeat_timeouts.load();
    j << ",\"rejoins\":" << rc.rejoins_accepted.load();
    j << "}";
    return j.str();
}

static void handle_signal(int)
{
    pong::g_shutdown.store(true);
}

int main(int argc, char **argv)
{
    std::string config_path = "config/server.yaml";
    bool cli_port_override = false;
    uint16_t port_override = 0;
    int duration_override_sec = 0; // 0 means run until signal
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port" && i + 1 < argc) {
            try {
                port_override = static_cast<uint16_t>(std::stoi(argv[++i]));
                cli_port_override = true;
            } catch (const std::exception &) {
                pong::log::warn("Invalid --port value '{}', ignoring", argv[i]);
            }
        } else if (a == "--duration" && i + 1 < argc) {
            try {
                duration_override_sec = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                pong::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        }
    }

    pong::ServerConfig cfg;
    try {
        cfg = pong::load_server_config(config_path);
    } catch (const YAML::Exception &ex) {
        pong::log::error("Failed to load config {}: {}", config_path, ex.what());
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // An explicit PONG_LOG_LEVEL in the environment wins over the config file.
    if (!cfg.log_level.empty() && std::getenv("PONG_LOG_LEVEL") == nullptr)
        setenv("PONG_LOG_LEVEL", cfg.log_level.c_str(), 1);
    if (cfg.log_json)
        setenv("PONG_LOG_JSON", "1", 1);
    pong::log::set_app_id("pong_relay");
    pong::log::init();
    // Argument warnings may have started the logger before the env was set.
    if (const char *lvl = std::getenv("PONG_LOG_LEVEL"))
        pong::log::set_level(lvl);
    if (cfg.log_json)
        pong::log::set_json(true);
    pong::log::info("pong relay starting (version: {})", PONG_VERSION);
    if (cli_port_override) {
        cfg.listen_port = port_override;
        pong::log::info("CLI override: listen_port set to {}", cfg.listen_port);
    }
    if (duration_override_sec > 0)
        pong::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);
    pong::log::info("Listening on port: {}", cfg.listen_port);
    pong::log::info("Auth mode: {}", cfg.auth_mode);

    static auto auth_provider_storage = pong::auth::make_provider(cfg.auth_mode, cfg.auth_stub_prefix);
    pong::auth::set_provider(auth_provider_storage.get());
    pong::tour::service().configure(pong::tour::ServiceConfig{
        cfg.tournament_min_players, cfg.tournament_max_players, cfg.default_rounds, cfg.fixed_seed});

    auto scheduler = coro::default_executor::io_executor();
    scheduler->spawn(pong::net::run_listener(scheduler, cfg.listen_port));
    scheduler->spawn(pong::mm::run_matchmaker(scheduler, pong::mm::MatchmakerConfig{cfg.matchmaker_poll_ms,
                                                             cfg.fixed_seed}));
    scheduler->spawn(heartbeat_monitor(scheduler, cfg.heartbeat_timeout_seconds));
    if (cfg.metrics_port != 0)
        scheduler->spawn(pong::net::run_metrics_endpoint(scheduler, cfg.metrics_port));

    auto run_start = std::chrono::steady_clock::now();
    auto last_metrics = run_start;
    while (!pong::g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        auto now = std::chrono::steady_clock::now();
        if (duration_override_sec > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - run_start).count();
            if (elapsed >= duration_override_sec) {
                pong::log::info("Duration reached ({}s >= {}s); initiating shutdown", elapsed, duration_override_sec);
                pong::g_shutdown.store(true);
            }
        }
        if (now - last_metrics >= std::chrono::seconds(60)) {
            last_metrics = now;
            pong::log::info("{}", metrics_json("relay"));
        }
    }
    pong::log::info("Shutdown complete.");
    pong::log::info("{}", metrics_json("relay_final"));
    pong::log::flush();
    return 0;
}
