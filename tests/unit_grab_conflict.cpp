// SPDX-License-Identifier: Apache-2.0
// A body has at most one holder. Simultaneous requests go to the lower player id,
// the loser stays Idle; candidate selection honors the grab radius and id ties.
#include "server/game/grab_controller.hpp"
#include "server/game/match.hpp"
#include "test_maps.hpp"

#include <cassert>
#include <iostream>

using namespace arena;

static int holders_of(const game::Match &m, uint32_t key)
{
    int n = 0;
    for (const auto &p : m.players()) {
        if (p.grabbing() && p.grab.body_key == key)
            ++n;
    }
    return n;
}

static void test_simultaneous_requests()
{
    auto lm = test::load_inline_map(R"(
gravity: [0, 0]
entities:
  - {id: 1, shape: rect, x1: 0.475, y1: 0.45, x2: 0.525, y2: 0.55}
)");
    game::MatchConfig cfg;
    cfg.lobby_countdown_ticks = 100000; // grabbing runs in the lobby too
    game::Match m(lm, cfg);
    m.add_player(1);
    m.add_player(2);

    auto in = [](bool g1, bool g2) {
        return std::vector<game::TickInput>{{1, {0.f, 0.f}, g1}, {2, {0.f, 0.f}, g2}};
    };

    // both cursors start at the origin, inside the box
    auto r = m.tick(in(true, true));
    assert(r.grabs.size() == 1);
    assert(r.grabs[0].player_id == 1 && r.grabs[0].acquired && r.grabs[0].body_key == 1);
    assert(m.find_player(1)->grabbing());
    assert(!m.find_player(2)->grabbing());

    for (int i = 0; i < 30; ++i) {
        m.tick(in(true, true));
        assert(holders_of(m, 1) == 1);
        assert(m.find_player(1)->grabbing());
    }
    // a fresh press while the body is held elsewhere fails silently
    m.tick(in(true, false));
    r = m.tick(in(true, true));
    assert(r.grabs.empty());
    assert(holders_of(m, 1) == 1 && !m.find_player(2)->grabbing());

    // release by 1; 2 is still pressing but has no rising edge
    r = m.tick(in(false, true));
    assert(r.grabs.size() == 1 && !r.grabs[0].acquired && r.grabs[0].release == game::ReleaseKind::Voluntary);
    assert(holders_of(m, 1) == 0);
    m.tick(in(false, false));
    r = m.tick(in(false, true));
    assert(r.grabs.size() == 1 && r.grabs[0].player_id == 2 && r.grabs[0].acquired);
    assert(holders_of(m, 1) == 1 && m.find_player(2)->grabbing());
    assert(m.world().find(1)->held);

    // the grabbing player is not "over grabbable", the other player cannot take it either
    assert(!m.is_over_grabbable(*m.find_player(2)));
    assert(!m.is_over_grabbable(*m.find_player(1)));
}

static void test_candidate_selection()
{
    auto lm = test::load_inline_map(R"(
gravity: [0, 0]
dimensions: [16, 9]
entities:
  - {id: 5, shape: circle, x: 0.25, y: 0.5, radius: 0.02}
  - {id: 3, shape: circle, x: 0.25, y: 0.5, radius: 0.02}
  - {id: 8, shape: rect, x1: 0.70, y1: 0.40, x2: 0.80, y2: 0.60, is_static: true}
  - {id: 9, shape: rect, x1: 0.45, y1: 0.45, x2: 0.55, y2: 0.55}
)");
    game::MatchConfig cfg;
    phys::PhysicsWorld world(game::make_physics_config(cfg, *lm));
    for (const auto &plan : lm->bodies)
        world.add_body(plan, lm->registry);
    game::GrabController grab(game::GrabConfig{0.05f, 3, 6.f, 1.f / 60.f});

    // equal distance: lowest entity id
    auto c = grab.pick_candidate({-4.f, 0.f}, world, {});
    assert(c && *c == 3);
    c = grab.pick_candidate({-4.f, 0.f}, world, {3});
    assert(c && *c == 5);
    assert(!grab.pick_candidate({-4.f, 0.f}, world, {3, 5}));

    // walls are never candidates
    assert(!grab.pick_candidate({4.f, 0.f}, world, {}));

    // grab radius measured from the shape boundary
    c = grab.pick_candidate({0.84f, 0.f}, world, {});
    assert(c && *c == 9);
    assert(!grab.pick_candidate({0.86f, 0.f}, world, {}));
}

int main()
{
    test_simultaneous_requests();
    test_candidate_selection();
    std::cout << "unit_grab_conflict OK" << std::endl;
    return 0;
}
