// SPDX-License-Identifier: Apache-2.0
#include "server/matchmaking/matchmaker.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "pong.pb.h"

#include <chrono>
#include <random>
#include <string>
#include <tuple>

namespace pong::mm {

static uint64_t random_seed()
{
    static std::mt19937_64 rng(std::random_device{}());
    return rng();
}

std::vector<Pairing> pair_waiting(const std::vector<std::shared_ptr<Session>> &queue)
{
    std::vector<Pairing> out;
    std::vector<bool> taken(queue.size(), false);
    for (size_t i = 0; i < queue.size(); ++i) {
        if (taken[i])
            continue;
        for (size_t j = i + 1; j < queue.size(); ++j) {
            if (taken[j] || queue[j]->rounds != queue[i]->rounds)
                continue;
            taken[i] = taken[j] = true;
            out.push_back({queue[i], queue[j], queue[i]->rounds});
            break;
        }
    }
    return out;
}

void start_room(const Pairing &p, uint64_t seed)
{
    auto &mgr = instance();
    const std::string room = mgr.next_room_name();
    mgr.pop_from_queue({p.left, p.right});
    mgr.open_room(p.left, p.right, room);
    for (const auto &[self, other, side] :
        {std::tuple{p.left, p.right, pong::SIDE_LEFT}, std::tuple{p.right, p.left, pong::SIDE_RIGHT}}) {
        pong::ServerMessage smsg;
        auto *sg = smsg.mutable_start_game();
        sg->set_message("Opponent found");
        sg->set_room(room);
        sg->set_rounds(p.rounds);
        sg->set_player_side(side);
        sg->set_opponent(other->nickname);
        sg->set_is_tournament(false);
        sg->set_seed(seed);
        mgr.push_message(self, smsg);
    }
    log::info("[mm] room {} {} (left) vs {} (right) rounds={} seed={}", room, p.left->nickname, p.right->nickname,
        p.rounds, seed);
}

void broadcast_waiting_list()
{
    auto &mgr = instance();
    pong::ServerMessage smsg;
    auto *wl = smsg.mutable_waiting_list();
    for (auto &w : mgr.waiting_list()) {
        auto *e = wl->add_entries();
        e->set_nickname(w.nickname);
        e->set_rounds(w.rounds);
    }
    mgr.broadcast(smsg);
}

coro::task<void> run_matchmaker(std::shared_ptr<coro::io_scheduler> scheduler, MatchmakerConfig cfg)
{
    co_await scheduler->schedule();
    log::info("matchmaker started (poll {}ms)", cfg.poll_interval_ms);
    auto &mgr = instance();
    while (true) {
        co_await scheduler->yield_for(std::chrono::milliseconds(cfg.poll_interval_ms));
        auto queued = mgr.snapshot_queue();
        if (queued.empty())
            continue;

        auto pairs = pair_waiting(queued);
        for (auto &p : pairs)
            start_room(p, cfg.fixed_seed > 0 ? cfg.fixed_seed : random_seed());
        if (!pairs.empty()) {
            broadcast_waiting_list();
            queued = mgr.snapshot_queue();
        }

        // Position updates only when a player's place in the line moved.
        for (size_t i = 0; i < queued.size(); ++i) {
            auto &sess = queued[i];
            const auto pos = static_cast<uint32_t>(i + 1);
            if (sess->last_queue_position == pos)
                continue;
            sess->last_queue_position = pos;
            pong::ServerMessage smsg;
            auto *qu = smsg.mutable_queue_update();
            qu->set_message("Waiting for an opponent");
            qu->set_rounds(sess->rounds);
            qu->set_position(pos);
            mgr.push_message(sess, smsg);
        }
    }
}

} // namespace pong::mm
