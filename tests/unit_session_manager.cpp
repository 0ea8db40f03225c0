// SPDX-License-Identifier: Apache-2.0
// Session lifecycle and input buffering: sequential ids, Welcome on connect, delta
// accumulation consumed once per tick, validation, bounded outbound queues, idle expiry.
#include "common/framing.hpp"
#include "common/metrics.hpp"
#include "server/game/match.hpp"
#include "server/session/session_manager.hpp"
#include "test_maps.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <thread>

using namespace arena;
using arena::test::near;

static arena::InputCommand cmd(float dx, float dy, bool down, uint32_t client_tick = 0)
{
    arena::InputCommand c;
    c.set_mouse_dx(dx);
    c.set_mouse_dy(dy);
    c.set_is_mouse_down(down);
    c.set_client_tick(client_tick);
    return c;
}

static arena::ServerMessage decode(const session::Frame &f)
{
    netutil::FrameParseState st;
    st.buffer.assign(f->begin(), f->end());
    std::string payload;
    auto status = netutil::try_extract(st, payload);
    assert(status == netutil::FrameStatus::Frame);
    arena::ServerMessage msg;
    bool ok = msg.ParseFromString(payload);
    assert(ok);
    return msg;
}

static const game::TickInput *input_for(const std::vector<game::TickInput> &v, uint32_t id)
{
    for (const auto &i : v) {
        if (i.player_id == id)
            return &i;
    }
    return nullptr;
}

// A connection coroutine polls the flag on its own io thread while another thread
// (idle monitor, send failure) disconnects the session.
static void test_disconnect_seen_across_threads()
{
    session::SessionManager mgr;
    auto s = mgr.add_local();
    std::atomic<bool> reader_started{false};
    std::thread reader([&] {
        reader_started.store(true);
        while (!s->disconnected.load(std::memory_order_acquire))
            std::this_thread::yield();
    });
    while (!reader_started.load())
        std::this_thread::yield();
    mgr.disconnect_session(s);
    reader.join();
    assert(s->disconnected);
    assert((mgr.take_departed() == std::vector<uint32_t>{s->player_id}));
}

int main()
{
    session::SessionManager mgr(session::SessionLimits{2.f, 4});
    auto s1 = mgr.add_local();
    auto s2 = mgr.add_local();
    auto s3 = mgr.add_local();
    assert(s1->player_id == 1 && s2->player_id == 2 && s3->player_id == 3);
    assert((mgr.take_joined() == std::vector<uint32_t>{1, 2, 3}));
    assert(mgr.take_joined().empty());

    auto frames = mgr.drain_frames(s1);
    assert(frames.size() == 1);
    auto welcome = decode(frames[0]);
    assert(welcome.has_welcome() && welcome.welcome().id() == 1);
    assert(mgr.drain_frames(s1).empty());

    // accumulation, last-write-wins grab, consumed once
    assert(mgr.record_input(s1, cmd(0.5f, 0.f, false)) == session::InputVerdict::Accepted);
    assert(mgr.record_input(s1, cmd(0.25f, 0.1f, true)) == session::InputVerdict::Accepted);
    auto in = mgr.drain_inputs();
    assert(in.size() == 3);
    assert(in[0].player_id == 1 && in[1].player_id == 2 && in[2].player_id == 3);
    assert(near(in[0].delta.x, 0.75f) && near(in[0].delta.y, 0.1f) && in[0].grab);
    in = mgr.drain_inputs();
    assert(in[0].delta.x == 0.f && in[0].delta.y == 0.f && in[0].grab);

    // per-message clamp
    mgr.record_input(s2, cmd(10.f, -10.f, false));
    in = mgr.drain_inputs();
    assert(input_for(in, 2)->delta.x == 2.f && input_for(in, 2)->delta.y == -2.f);

    // non-finite input is dropped and counted
    auto malformed_before = metrics::runtime().malformed_inputs.load();
    mgr.record_input(s2, cmd(0.3f, 0.f, true));
    float nan = std::numeric_limits<float>::quiet_NaN();
    assert(mgr.record_input(s2, cmd(nan, 0.f, false)) == session::InputVerdict::Malformed);
    assert(mgr.record_input(s2, cmd(0.f, std::numeric_limits<float>::infinity(), false))
        == session::InputVerdict::Malformed);
    assert(metrics::runtime().malformed_inputs.load() - malformed_before == 2);
    in = mgr.drain_inputs();
    assert(near(input_for(in, 2)->delta.x, 0.3f) && input_for(in, 2)->grab);

    // stale client ticks are ignored
    assert(mgr.record_input(s3, cmd(0.1f, 0.f, true, 5)) == session::InputVerdict::Accepted);
    assert(mgr.record_input(s3, cmd(0.4f, 0.f, false, 3)) == session::InputVerdict::Stale);
    in = mgr.drain_inputs();
    assert(near(input_for(in, 3)->delta.x, 0.1f) && input_for(in, 3)->grab);

    // bounded outbound queues drop the oldest frame
    auto dropped_before = metrics::snapshot().dropped_frames.load();
    std::vector<session::Frame> sent;
    for (int i = 0; i < 10; ++i) {
        arena::ServerMessage msg;
        msg.mutable_heartbeat_resp()->set_server_time_ms(static_cast<uint64_t>(i));
        sent.push_back(session::make_frame(msg));
        mgr.broadcast(sent.back());
    }
    // s1 started empty, s2 and s3 still held their Welcome
    assert(metrics::snapshot().dropped_frames.load() - dropped_before == 6 + 7 + 7);
    auto q3 = mgr.drain_frames(s3);
    assert(q3.size() == 4);
    for (int i = 0; i < 4; ++i)
        assert(q3[i] == sent[6 + i]); // the same frame object is shared by every recipient
    assert(decode(q3[3]).heartbeat_resp().server_time_ms() == 9);
    mgr.drain_frames(s1);
    mgr.drain_frames(s2);

    // disconnect: neutral input meanwhile, removal reported once
    mgr.disconnect_session(s2);
    mgr.disconnect_session(s2);
    in = mgr.drain_inputs();
    assert(in.size() == 2 && !input_for(in, 2));
    assert((mgr.connected_ids() == std::vector<uint32_t>{1, 3}));
    assert((mgr.take_departed() == std::vector<uint32_t>{2}));
    assert(mgr.take_departed().empty());
    assert(mgr.find(2) == nullptr);
    mgr.broadcast(sent[0]);
    assert(s2->outgoing.empty());

    // idle expiry applies to network sessions only
    auto scheduler = coro::default_executor::io_executor();
    coro::net::tcp::client client{scheduler};
    auto net = mgr.add_connection(std::move(client));
    assert(net->player_id == 4);
    assert(net->connection_id == "conn_4");
    auto now = std::chrono::steady_clock::now();
    assert(mgr.expire_idle(now, std::chrono::seconds(15)).empty());
    net->last_traffic -= std::chrono::hours(1);
    s1->last_traffic -= std::chrono::hours(1);
    auto expired = mgr.expire_idle(now, std::chrono::seconds(15));
    assert(expired.size() == 1 && expired[0] == net);
    assert(net->disconnected && !s1->disconnected);
    assert((mgr.take_departed() == std::vector<uint32_t>{4}));

    // a malformed message arriving between ticks 10 and 11 changes nothing
    auto lm = test::load_inline_map("gravity: [0, 0]\n");
    game::MatchConfig cfg;
    cfg.min_players = 1;
    cfg.lobby_countdown_ticks = 1000;
    game::Match match(lm, cfg);
    mgr.take_joined();
    for (auto id : mgr.connected_ids())
        match.add_player(id);
    for (int t = 1; t <= 10; ++t) {
        mgr.record_input(s1, cmd(0.1f, 0.f, false));
        match.tick(mgr.drain_inputs());
    }
    assert(match.server_tick() == 10);
    assert(near(match.find_player(1)->cursor.x, 1.f));
    mgr.record_input(s1, cmd(0.2f, 0.05f, true));
    assert(mgr.record_input(s1, cmd(nan, 0.3f, false)) == session::InputVerdict::Malformed);
    match.tick(mgr.drain_inputs());
    const auto *p = match.find_player(1);
    assert(near(p->cursor.x, 1.2f) && near(p->cursor.y, 0.05f));
    assert(p->grab_input);
    assert(!s1->disconnected);
    match.tick(mgr.drain_inputs());
    assert(near(match.find_player(1)->cursor.x, 1.2f)); // consumed exactly once

    test_disconnect_seen_across_threads();

    std::cout << "unit_session_manager OK" << std::endl;
    return 0;
}
