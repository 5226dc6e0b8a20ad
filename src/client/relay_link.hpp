// SPDX-License-Identifier: Apache-2.0
// relay_link.hpp - framed protobuf connection from a peer to the relay.
#pragma once
#include "common/framing.hpp"

#include "pong.pb.h"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pong::client {

class RelayLink
{
public:
    // host must be a numeric IPv4 or IPv6 address.
    RelayLink(std::shared_ptr<coro::io_scheduler> scheduler, std::string host, uint16_t port);

    coro::task<bool> connect(std::chrono::milliseconds timeout);
    // Drops the current socket and connects again; buffered input is discarded.
    coro::task<bool> reconnect(std::chrono::milliseconds timeout);
    void close();
    bool connected() const { return m_client != nullptr; }

    coro::task<bool> send(const pong::ClientMessage &msg);
    coro::task<bool> send(const std::vector<pong::ClientMessage> &msgs);

    // Waits up to timeout (at least 1ms) for input and returns every complete
    // message read. An empty vector means nothing arrived; nullopt means the
    // connection closed or sent a corrupt frame, after which connected() is false.
    coro::task<std::optional<std::vector<pong::ServerMessage>>> poll_recv(std::chrono::milliseconds timeout);

private:
    coro::task<bool> send_bytes(const std::string &bytes);

    std::shared_ptr<coro::io_scheduler> m_scheduler;
    std::string m_host;
    uint16_t m_port;
    std::unique_ptr<coro::net::tcp::client> m_client;
    netutil::FrameParseState m_fps;
    std::string m_buf;
};

} // namespace pong::client
