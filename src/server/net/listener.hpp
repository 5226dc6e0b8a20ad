// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "pong.pb.h"
#include "server/matchmaking/session_manager.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>

namespace pong::net {

// Starts the TCP accept loop on the given port; one connection loop per client.
coro::task<void> run_listener(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port);

// Dispatches one decoded client message. Replies are queued on the session
// (and on its room partner where relevant); nothing is written to sockets here.
void handle_message(const std::shared_ptr<mm::Session> &session, const pong::ClientMessage &msg);

// Connection gone: leaves the queue and any tournament, tells the room partner.
// Safe to call more than once.
void handle_disconnect(const std::shared_ptr<mm::Session> &session);

} // namespace pong::net
