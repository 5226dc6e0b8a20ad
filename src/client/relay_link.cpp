// SPDX-License-Identifier: Apache-2.0
#include "client/relay_link.hpp"

#include "common/logger.hpp"

#include <coro/poll.hpp>

#include <algorithm>
#include <span>

namespace pong::client {

RelayLink::RelayLink(std::shared_ptr<coro::io_scheduler> scheduler, std::string host, uint16_t port)
    : m_scheduler(std::move(scheduler)), m_host(std::move(host)), m_port(port), m_buf(4096, '\0')
{}

coro::task<bool> RelayLink::connect(std::chrono::milliseconds timeout)
{
    m_fps = netutil::FrameParseState{};
    auto cli = std::make_unique<coro::net::tcp::client>(
        m_scheduler,
        coro::net::tcp::client::options{.address = coro::net::ip_address::from_string(m_host), .port = m_port});
    auto status = co_await cli->connect(timeout);
    if (status != coro::net::connect_status::connected) {
        log::warn("[link] connect to {}:{} failed", m_host, m_port);
        m_client.reset();
        co_return false;
    }
    m_client = std::move(cli);
    log::info("[link] connected to {}:{}", m_host, m_port);
    co_return true;
}

coro::task<bool> RelayLink::reconnect(std::chrono::milliseconds timeout)
{
    close();
    co_return co_await connect(timeout);
}

void RelayLink::close()
{
    m_client.reset();
    m_fps = netutil::FrameParseState{};
}

coro::task<bool> RelayLink::send_bytes(const std::string &bytes)
{
    if (!m_client)
        co_return false;
    std::span<const char> rest(bytes.data(), bytes.size());
    while (!rest.empty()) {
        co_await m_client->poll(coro::poll_op::write);
        auto [st, remaining] = m_client->send(rest);
        if (st != coro::net::send_status::ok && st != coro::net::send_status::would_block) {
            log::warn("[link] send failed");
            close();
            co_return false;
        }
        rest = remaining;
    }
    co_return true;
}

coro::task<bool> RelayLink::send(const pong::ClientMessage &msg)
{
    std::string frame;
    if (!netutil::append_message(frame, msg))
        co_return false;
    co_return co_await send_bytes(frame);
}

coro::task<bool> RelayLink::send(const std::vector<pong::ClientMessage> &msgs)
{
    if (msgs.empty())
        co_return m_client != nullptr;
    std::string batch;
    batch.reserve(msgs.size() * 48);
    for (const auto &m : msgs)
        if (!netutil::append_message(batch, m))
            log::warn("[link] failed to serialize client message");
    co_return co_await send_bytes(batch);
}

coro::task<std::optional<std::vector<pong::ServerMessage>>> RelayLink::poll_recv(std::chrono::milliseconds timeout)
{
    if (!m_client)
        co_return std::nullopt;
    std::vector<pong::ServerMessage> out;
    // libcoro treats a zero timeout as "wait forever".
    auto pstat = co_await m_client->poll(coro::poll_op::read, std::max(timeout, std::chrono::milliseconds(1)));
    if (pstat == coro::poll_status::timeout)
        co_return out;
    if (pstat != coro::poll_status::event) {
        log::info("[link] connection closed");
        close();
        co_return std::nullopt;
    }
    auto [st, span] = m_client->recv(m_buf);
    if (st == coro::net::recv_status::closed
        || (st != coro::net::recv_status::ok && st != coro::net::recv_status::would_block)) {
        log::info("[link] connection closed by relay");
        close();
        co_return std::nullopt;
    }
    if (st == coro::net::recv_status::ok)
        netutil::feed(m_fps, span.data(), span.size());
    std::string payload;
    while (netutil::try_extract(m_fps, payload)) {
        pong::ServerMessage msg;
        if (!msg.ParseFromString(payload)) {
            m_fps.corrupt = true;
            break;
        }
        out.push_back(std::move(msg));
    }
    if (m_fps.corrupt) {
        log::error("[link] corrupt frame from relay, dropping connection");
        close();
        co_return std::nullopt;
    }
    co_return out;
}

} // namespace pong::client
