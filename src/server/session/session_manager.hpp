// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "arena.pb.h"
#include "server/game/match.hpp"

#include <coro/net/tcp/client.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace arena::session {

// Pre-framed outbound payload; one instance is shared by every recipient of a broadcast.
using Frame = std::shared_ptr<const std::string>;

Frame make_frame(const arena::ServerMessage &msg);

struct Session
{
    uint32_t player_id{0};
    std::string connection_id; // empty for local sessions
    // Written under the manager's mutex, read lock-free by the connection coroutine.
    std::atomic<bool> disconnected{false};
    std::chrono::steady_clock::time_point last_traffic{};

    // Accumulated since the last tick consumed it.
    struct InputBuffer
    {
        float dx{0.f};
        float dy{0.f};
        bool grab{false}; // last write wins, survives consumption
        uint32_t last_client_tick{0};
    } input;

    std::unique_ptr<coro::net::tcp::client> client; // nullptr for local sessions
    std::deque<Frame> outgoing; // bounded, oldest dropped first

    explicit Session(coro::net::tcp::client c) : client(std::make_unique<coro::net::tcp::client>(std::move(c))) {}

    Session() = default;
};

enum class InputVerdict
{
    Accepted,
    Stale, // client_tick older than the last accepted one
    Malformed // non-finite values; buffer untouched
};

struct SessionLimits
{
    float max_input_delta{2.f}; // per-message clamp on each delta component
    std::size_t max_outbound_frames{256};
};

class SessionManager
{
public:
    explicit SessionManager(const SessionLimits &limits = {}) : m_limits(limits) {}

    // Assigns the next player id (from 1) and queues the Welcome frame.
    std::shared_ptr<Session> add_connection(coro::net::tcp::client client);
    // Same as add_connection without a socket (local play, tools, tests).
    std::shared_ptr<Session> add_local();

    InputVerdict record_input(const std::shared_ptr<Session> &s, const arena::InputCommand &cmd);
    void touch(const std::shared_ptr<Session> &s);

    // Consumes every live session's buffered input, ascending player id. Deltas are zeroed;
    // the grab flag persists. Disconnected sessions yield no entry (neutral input).
    std::vector<game::TickInput> drain_inputs();
    // Player ids added since the previous call.
    std::vector<uint32_t> take_joined();
    // Player ids disconnected since the previous call; their sessions are dropped.
    std::vector<uint32_t> take_departed();
    std::vector<uint32_t> connected_ids();

    void disconnect_session(const std::shared_ptr<Session> &s);
    // Marks sessions with no traffic for `timeout` as disconnected and returns them.
    std::vector<std::shared_ptr<Session>> expire_idle(
        std::chrono::steady_clock::time_point now, std::chrono::steady_clock::duration timeout);

    void push_frame(const std::shared_ptr<Session> &s, Frame f);
    void push_message(const std::shared_ptr<Session> &s, const arena::ServerMessage &msg);
    // Queues the same frame on every live session.
    void broadcast(const Frame &f);
    std::vector<Frame> drain_frames(const std::shared_ptr<Session> &s);

    std::vector<std::shared_ptr<Session>> snapshot_all_sessions();
    std::shared_ptr<Session> find(uint32_t player_id);

private:
    std::shared_ptr<Session> register_session(std::shared_ptr<Session> s);
    void push_locked(Session &s, Frame f);

    SessionLimits m_limits;
    std::mutex m_mutex;
    uint32_t m_next_player_id{1};
    std::vector<std::shared_ptr<Session>> m_sessions; // ascending player id
    std::vector<uint32_t> m_joined;
    std::vector<uint32_t> m_departed;
};

} // namespace arena::session
