// SPDX-License-Identifier: Apache-2.0
#include "server/session/session_manager.hpp"

#include "common/framing.hpp"
#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>
#include <cmath>

namespace arena::session {

Frame make_frame(const arena::ServerMessage &msg)
{
    std::string payload;
    if (!msg.SerializeToString(&payload)) {
        log::error("[session] failed to serialize server message");
        return nullptr;
    }
    return std::make_shared<const std::string>(netutil::build_frame(payload));
}

std::shared_ptr<Session> SessionManager::register_session(std::shared_ptr<Session> s)
{
    arena::ServerMessage welcome;
    std::scoped_lock lk{m_mutex};
    s->player_id = m_next_player_id++;
    if (s->client)
        s->connection_id = "conn_" + std::to_string(s->player_id);
    s->last_traffic = std::chrono::steady_clock::now();
    welcome.mutable_welcome()->set_id(s->player_id);
    push_locked(*s, make_frame(welcome));
    m_sessions.push_back(s);
    m_joined.push_back(s->player_id);
    metrics::inc(metrics::runtime().connected_players);
    log::info("[session] player {} connected{}", s->player_id, s->connection_id.empty() ? " (local)" : "");
    return s;
}

std::shared_ptr<Session> SessionManager::add_connection(coro::net::tcp::client client)
{
    return register_session(std::make_shared<Session>(std::move(client)));
}

std::shared_ptr<Session> SessionManager::add_local()
{
    return register_session(std::make_shared<Session>());
}

InputVerdict SessionManager::record_input(const std::shared_ptr<Session> &s, const arena::InputCommand &cmd)
{
    if (!std::isfinite(cmd.mouse_dx()) || !std::isfinite(cmd.mouse_dy())) {
        metrics::inc(metrics::runtime().malformed_inputs);
        ARENA_LOG_EVERY_N(warn, 100, "[input] MalformedInput from player {} dropped", s->player_id);
        return InputVerdict::Malformed;
    }
    std::scoped_lock lk{m_mutex};
    s->last_traffic = std::chrono::steady_clock::now();
    if (s->disconnected)
        return InputVerdict::Stale;
    if (cmd.client_tick() != 0 && cmd.client_tick() < s->input.last_client_tick)
        return InputVerdict::Stale;
    const float lim = m_limits.max_input_delta;
    s->input.dx += std::clamp(cmd.mouse_dx(), -lim, lim);
    s->input.dy += std::clamp(cmd.mouse_dy(), -lim, lim);
    if (s->input.grab != cmd.is_mouse_down())
        log::trace("[input] player {} grab={}", s->player_id, cmd.is_mouse_down());
    s->input.grab = cmd.is_mouse_down();
    if (cmd.client_tick() != 0)
        s->input.last_client_tick = cmd.client_tick();
    return InputVerdict::Accepted;
}

void SessionManager::touch(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    s->last_traffic = std::chrono::steady_clock::now();
}

std::vector<game::TickInput> SessionManager::drain_inputs()
{
    std::scoped_lock lk{m_mutex};
    std::vector<game::TickInput> out;
    out.reserve(m_sessions.size());
    for (auto &s : m_sessions) {
        if (!s->disconnected)
            out.push_back({s->player_id, {s->input.dx, s->input.dy}, s->input.grab});
        s->input.dx = 0.f;
        s->input.dy = 0.f;
    }
    return out;
}

std::vector<uint32_t> SessionManager::take_joined()
{
    std::scoped_lock lk{m_mutex};
    std::vector<uint32_t> out;
    out.swap(m_joined);
    return out;
}

std::vector<uint32_t> SessionManager::take_departed()
{
    std::scoped_lock lk{m_mutex};
    std::vector<uint32_t> out;
    out.swap(m_departed);
    std::sort(out.begin(), out.end());
    m_sessions.erase(
        std::remove_if(m_sessions.begin(), m_sessions.end(), [](const auto &s) { return s->disconnected; }),
        m_sessions.end());
    return out;
}

std::vector<uint32_t> SessionManager::connected_ids()
{
    std::scoped_lock lk{m_mutex};
    std::vector<uint32_t> out;
    for (const auto &s : m_sessions) {
        if (!s->disconnected)
            out.push_back(s->player_id);
    }
    return out;
}

void SessionManager::disconnect_session(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (s->disconnected)
        return;
    s->disconnected = true;
    s->outgoing.clear();
    m_departed.push_back(s->player_id);
    auto &cp = metrics::runtime().connected_players;
    if (cp.load(std::memory_order_relaxed) > 0)
        cp.fetch_sub(1, std::memory_order_relaxed);
    log::info("[session] player {} disconnected", s->player_id);
}

std::vector<std::shared_ptr<Session>> SessionManager::expire_idle(
    std::chrono::steady_clock::time_point now, std::chrono::steady_clock::duration timeout)
{
    std::vector<std::shared_ptr<Session>> idle;
    {
        std::scoped_lock lk{m_mutex};
        for (auto &s : m_sessions) {
            if (!s->disconnected && s->client && now - s->last_traffic > timeout)
                idle.push_back(s);
        }
    }
    for (auto &s : idle) {
        log::warn("[session] player {} idle timeout", s->player_id);
        disconnect_session(s);
    }
    return idle;
}

void SessionManager::push_locked(Session &s, Frame f)
{
    if (!f || s.disconnected)
        return;
    if (s.outgoing.size() >= m_limits.max_outbound_frames) {
        s.outgoing.pop_front();
        metrics::inc(metrics::snapshot().dropped_frames);
    }
    s.outgoing.push_back(std::move(f));
}

void SessionManager::push_frame(const std::shared_ptr<Session> &s, Frame f)
{
    std::scoped_lock lk{m_mutex};
    push_locked(*s, std::move(f));
}

void SessionManager::push_message(const std::shared_ptr<Session> &s, const arena::ServerMessage &msg)
{
    push_frame(s, make_frame(msg));
}

void SessionManager::broadcast(const Frame &f)
{
    std::scoped_lock lk{m_mutex};
    for (auto &s : m_sessions)
        push_locked(*s, f);
}

std::vector<Frame> SessionManager::drain_frames(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    std::vector<Frame> out(s->outgoing.begin(), s->outgoing.end());
    s->outgoing.clear();
    return out;
}

std::vector<std::shared_ptr<Session>> SessionManager::snapshot_all_sessions()
{
    std::scoped_lock lk{m_mutex};
    return m_sessions;
}

std::shared_ptr<Session> SessionManager::find(uint32_t player_id)
{
    std::scoped_lock lk{m_mutex};
    for (auto &s : m_sessions) {
        if (s->player_id == player_id)
            return s;
    }
    return nullptr;
}

} // namespace arena::session
