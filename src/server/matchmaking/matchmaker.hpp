// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/matchmaking/session_manager.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace pong::mm {

struct MatchmakerConfig
{
    uint32_t poll_interval_ms{100};
    // Fixed per-room physics seed; 0 draws a random one per room.
    uint64_t fixed_seed{0};
};

struct Pairing
{
    std::shared_ptr<Session> left; // longer waiter
    std::shared_ptr<Session> right;
    uint32_t rounds{0};
};

// Pairs queued sessions that asked for the same number of rounds, oldest
// first. queue must be in join order; unmatched sessions are left out.
std::vector<Pairing> pair_waiting(const std::vector<std::shared_ptr<Session>> &queue);

// Seats a pairing in a fresh room and sends start_game to both.
void start_room(const Pairing &p, uint64_t seed);

// Sends the current waiting list to every connected session.
void broadcast_waiting_list();

coro::task<void> run_matchmaker(std::shared_ptr<coro::io_scheduler> scheduler, MatchmakerConfig cfg);

} // namespace pong::mm
