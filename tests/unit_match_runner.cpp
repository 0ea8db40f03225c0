// SPDX-License-Identifier: Apache-2.0
// Tick driver: sessions feed the match, events and snapshots fan out as frames,
// the next match starts on the store's map after the post-end grace.
#include "common/metrics.hpp"
#include "server/game/match_runner.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace arena;

static const char *kHazardMap = R"(
gravity: [0, 0]
dimensions: [16, 9]
entities:
  - {id: 1, shape: rect, x1: 0.8, y1: 0.4, x2: 0.9, y2: 0.6, is_static: true, is_death: true}
  - {id: 2, shape: rect, x1: 0.1, y1: 0.1, x2: 0.15, y2: 0.15}
)";

static std::vector<arena::ServerMessage> decode(const std::vector<session::Frame> &frames)
{
    std::vector<arena::ServerMessage> out;
    for (const auto &f : frames) {
        assert(f && f->size() > 4);
        uint32_t len = (uint32_t(uint8_t((*f)[0])) << 24) | (uint32_t(uint8_t((*f)[1])) << 16) |
            (uint32_t(uint8_t((*f)[2])) << 8) | uint32_t(uint8_t((*f)[3]));
        assert(len == f->size() - 4);
        arena::ServerMessage m;
        bool ok = m.ParseFromArray(f->data() + 4, static_cast<int>(len));
        assert(ok);
        out.push_back(std::move(m));
    }
    return out;
}

int main()
{
    std::vector<map::LoadWarning> warnings;
    auto doc = map::parse_map_string(kHazardMap, warnings);
    assert(warnings.empty());
    auto maps = std::make_shared<map::MapStore>();
    assert(maps->install(doc));

    auto sessions = std::make_shared<session::SessionManager>(session::SessionLimits{10.f, 64});
    auto s1 = sessions->add_local();
    auto s2 = sessions->add_local();

    game::MatchConfig cfg;
    cfg.min_players = 2;
    cfg.lobby_countdown_ticks = 2;
    cfg.post_end_grace_ticks = 3;
    game::MatchRunner runner(sessions, maps, cfg);
    assert(runner.matches_started() == 1);
    uint64_t completed_before = metrics::runtime().matches_completed.load();

    auto rep = runner.step();
    assert(rep.tick == 1 && rep.snapshot_bytes > 0);
    auto msgs = decode(sessions->drain_frames(s1));
    assert(msgs.size() == 2);
    assert(msgs[0].has_welcome() && msgs[0].welcome().id() == s1->player_id);
    assert(msgs[1].has_game_state());
    assert(msgs[1].game_state().server_tick() == 1);
    assert(msgs[1].game_state().phase() == arena::LOBBY);
    assert(msgs[1].game_state().players_size() == 2);
    assert(msgs[1].game_state().objects_size() == 2);

    // p2 walks into the hazard while the countdown finishes
    arena::InputCommand in;
    in.set_mouse_dx(5.6f);
    assert(sessions->record_input(s2, in) == session::InputVerdict::Accepted);
    rep = runner.step();
    assert(rep.tick == 2);
    assert(runner.match().phase() == game::MatchPhase::Active);
    assert(runner.match().find_player(s2->player_id)->alive);

    rep = runner.step();
    assert(rep.tick == 3 && rep.match_ended);
    assert(runner.match().phase() == game::MatchPhase::Ended);

    int eliminated = 0, ended = 0;
    auto collect = [&](const std::vector<arena::ServerMessage> &ms)
    {
        for (const auto &m : ms) {
            if (m.has_eliminated()) {
                ++eliminated;
                assert(m.eliminated().player_id() == s2->player_id);
                assert(m.eliminated().killer_id() == 0);
                assert(m.eliminated().server_tick() == 3);
            }
            if (m.has_match_end()) {
                ++ended;
                assert(m.match_end().winner_id() == s1->player_id);
                assert(m.match_end().draw_ids_size() == 0);
                assert(m.match_end().elimination_order_size() == 1);
                assert(m.match_end().elimination_order(0) == s2->player_id);
                assert(m.match_end().server_tick() == 3);
            }
        }
    };
    msgs = decode(sessions->drain_frames(s1));
    // event frames precede the snapshot of the same tick
    assert(msgs.size() == 4);
    assert(msgs[0].has_game_state() && msgs[0].game_state().server_tick() == 2);
    assert(msgs[1].has_eliminated() && msgs[2].has_match_end());
    assert(msgs[3].has_game_state() && msgs[3].game_state().phase() == arena::ENDED);
    collect(msgs);

    rep = runner.step();
    assert(!rep.new_match && !rep.match_ended);
    rep = runner.step();
    assert(!rep.new_match);
    collect(decode(sessions->drain_frames(s1)));
    rep = runner.step();
    assert(rep.tick == 6 && rep.new_match);
    collect(decode(sessions->drain_frames(s1)));
    assert(eliminated == 1 && ended == 1);
    assert(metrics::runtime().matches_completed.load() == completed_before + 1);

    assert(runner.matches_started() == 2);
    const auto &next = runner.match();
    assert(next.server_tick() == 0);
    assert(next.phase() == game::MatchPhase::Lobby);
    assert(next.players().size() == 2);
    for (const auto &p : next.players())
        assert(p.alive && !p.spectator);

    std::cout << "unit_match_runner OK" << std::endl;
    return 0;
}
