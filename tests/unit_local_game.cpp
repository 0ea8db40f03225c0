// SPDX-License-Identifier: Apache-2.0
// Single-player local simulation: tick, snapshot, pause and restart.
#include "server/game/local_game.hpp"
#include "server/map/map_document.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace arena;

int main()
{
    auto map = std::make_shared<const map::LoadedMap>(map::load_map(map::default_map_document()));
    game::LocalGame g(map, game::MatchConfig{});

    auto gs = g.game_state();
    assert(gs.server_tick() == 0);
    assert(gs.phase() == arena::LOBBY);
    assert(gs.boundaries_size() == 4);
    assert(gs.objects_size() == 40);
    assert(gs.players_size() == 1);
    assert(gs.players(0).id() == game::LocalGame::kLocalPlayerId);
    assert(std::fabs(gs.cursor_size() - 0.35f) < 1e-6f);

    // the grid has a box centered at (0.5, 0)
    g.tick(0.5f, 0.f, true);
    gs = g.game_state();
    assert(gs.server_tick() == 1);
    assert(gs.phase() == arena::ACTIVE);
    assert(gs.players(0).is_grabbing());
    assert(std::fabs(gs.players(0).x() - 0.5f) < 1e-6f);
    assert(gs.players(0).alive());

    g.pause();
    assert(g.paused());
    for (int i = 0; i < 10; ++i)
        g.tick(1.f, 1.f, false);
    gs = g.game_state();
    assert(gs.server_tick() == 1);
    assert(std::fabs(gs.players(0).x() - 0.5f) < 1e-6f);
    assert(gs.players(0).is_grabbing());

    g.pause();
    assert(!g.paused());
    g.tick(0.f, 0.f, true);
    assert(g.game_state().server_tick() == 2);

    g.pause();
    g.restart();
    assert(!g.paused());
    gs = g.game_state();
    assert(gs.server_tick() == 0);
    assert(gs.phase() == arena::LOBBY);
    assert(gs.objects_size() == 40);
    assert(gs.players_size() == 1);
    assert(!gs.players(0).is_grabbing());
    assert(gs.players(0).x() == 0.f && gs.players(0).y() == 0.f);

    // the cursor stops at the inner faces of the boundary walls (half thickness 0.1)
    g.tick(100.f, -100.f, false);
    gs = g.game_state();
    assert(std::fabs(gs.players(0).x() - 7.9f) < 1e-5f);
    assert(std::fabs(gs.players(0).y() + 4.4f) < 1e-5f);
    g.tick(-300.f, 300.f, false);
    gs = g.game_state();
    assert(std::fabs(gs.players(0).x() + 7.9f) < 1e-5f);
    assert(std::fabs(gs.players(0).y() - 4.4f) < 1e-5f);

    std::cout << "unit_local_game OK" << std::endl;
    return 0;
}
