// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "arena.pb.h"
#include "common/framing.hpp"
#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <chrono>
#include <span>
#include <string>

namespace arena::net {

static coro::task<void> connection_loop(std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<session::SessionManager> sessions, std::shared_ptr<session::Session> session,
    std::chrono::milliseconds poll_timeout);

coro::task<void> run_listener(std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<session::SessionManager> sessions, uint16_t port, uint32_t tick_rate,
    std::shared_ptr<std::atomic<bool>> running)
{
    co_await scheduler->schedule();
    log::info("[listener] TCP listener on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    auto poll_timeout = std::chrono::milliseconds(std::max<uint32_t>(1, 1000 / std::max<uint32_t>(tick_rate, 1)));
    while (running->load(std::memory_order_relaxed)) {
        auto status = co_await server.poll(std::chrono::milliseconds(250));
        if (status == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                auto session = sessions->add_connection(std::move(client));
                scheduler->spawn(connection_loop(scheduler, sessions, session, poll_timeout));
            }
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            log::error("[listener] poll error/closed, exiting listener loop");
            co_return;
        }
    }
    log::info("[listener] stopped");
}

// Returns false when the peer can no longer be written to.
static coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        auto pstat = co_await client.poll(coro::poll_op::write);
        if (pstat != coro::poll_status::event)
            co_return false;
        auto [s, remaining] = client.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

static void handle_message(session::SessionManager &sessions, const std::shared_ptr<session::Session> &session,
    const arena::ClientMessage &cmsg)
{
    if (cmsg.has_input()) {
        // malformed input is counted and logged by the manager; the buffer keeps its previous value
        (void)sessions.record_input(session, cmsg.input());
    } else if (cmsg.has_heartbeat()) {
        sessions.touch(session);
        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
                          .count();
        arena::ServerMessage hb;
        auto *hbr = hb.mutable_heartbeat_resp();
        hbr->set_client_time_ms(cmsg.heartbeat().time_ms());
        hbr->set_server_time_ms(static_cast<uint64_t>(now_ms));
        sessions.push_message(session, hb);
    }
}

static coro::task<void> connection_loop(std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<session::SessionManager> sessions, std::shared_ptr<session::Session> session,
    std::chrono::milliseconds poll_timeout)
{
    co_await scheduler->schedule();
    log::debug("[conn] {} loop start player={}", session->connection_id, session->player_id);
    netutil::FrameParseState fps;
    std::string tmp(4096, '\0');
    while (!session->disconnected) {
        for (const auto &frame : sessions->drain_frames(session)) {
            if (!co_await send_all(*session->client, std::span<const char>(frame->data(), frame->size()))) {
                log::info("[conn] {} send failed", session->connection_id);
                sessions->disconnect_session(session);
                co_return;
            }
        }
        auto pstat = co_await session->client->poll(coro::poll_op::read, poll_timeout);
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat != coro::poll_status::event) {
            sessions->disconnect_session(session);
            co_return;
        }
        auto [rstatus, span] = session->client->recv(tmp);
        if (rstatus == coro::net::recv_status::closed) {
            log::info("[conn] {} closed by peer", session->connection_id);
            sessions->disconnect_session(session);
            co_return;
        }
        if (rstatus != coro::net::recv_status::ok && rstatus != coro::net::recv_status::would_block) {
            log::warn("[conn] {} recv error", session->connection_id);
            sessions->disconnect_session(session);
            co_return;
        }
        if (rstatus != coro::net::recv_status::ok)
            continue;
        fps.buffer.insert(fps.buffer.end(), span.begin(), span.end());
        sessions->touch(session);
        std::string payload;
        while (true) {
            auto st = netutil::try_extract(fps, payload);
            if (st == netutil::FrameStatus::NeedMore)
                break;
            if (st == netutil::FrameStatus::Invalid) {
                metrics::inc(metrics::runtime().invalid_frames);
                ARENA_LOG_EVERY_N(warn, 50, "[conn] {} corrupt framing, receive buffer discarded",
                    session->connection_id);
                break;
            }
            arena::ClientMessage cmsg;
            if (!cmsg.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
                metrics::inc(metrics::runtime().malformed_inputs);
                ARENA_LOG_EVERY_N(warn, 50, "[conn] {} MalformedInput: unparseable message dropped",
                    session->connection_id);
                continue;
            }
            handle_message(*sessions, session, cmsg);
        }
    }
}

} // namespace arena::net
