// SPDX-License-Identifier: Apache-2.0
// Two matches fed the same map and the same input script must stay bit-identical.
#include "server/game/match.hpp"
#include "server/map/map_document.hpp"
#include "server/map/map_loader.hpp"

#include <cassert>
#include <cmath>
#include <cstring>
#include <iostream>
#include <memory>

using namespace arena;

static std::vector<game::TickInput> script(uint64_t t)
{
    float ft = static_cast<float>(t);
    return {
        {1, {0.05f * std::sin(ft * 0.1f), 0.05f * std::cos(ft * 0.07f)}, (t / 40) % 2 == 0},
        {2, {-0.04f * std::cos(ft * 0.13f), 0.03f * std::sin(ft * 0.05f)}, (t / 25) % 3 != 0},
    };
}

static bool same_bits(const b2Transform &a, const b2Transform &b)
{
    return std::memcmp(&a, &b, sizeof(b2Transform)) == 0;
}

int main()
{
    auto lm = std::make_shared<const map::LoadedMap>(map::load_map(map::default_map_document()));
    game::MatchConfig cfg;
    cfg.lobby_countdown_ticks = 30;
    game::Match a(lm, cfg);
    game::Match b(lm, cfg);
    for (auto *m : {&a, &b}) {
        m->add_player(1);
        m->add_player(2);
    }

    int grabs = 0;
    for (uint64_t t = 1; t <= 600; ++t) {
        auto ra = a.tick(script(t));
        auto rb = b.tick(script(t));
        assert(ra.tick == rb.tick);
        assert(ra.grabs.size() == rb.grabs.size());
        for (std::size_t i = 0; i < ra.grabs.size(); ++i) {
            assert(ra.grabs[i].player_id == rb.grabs[i].player_id);
            assert(ra.grabs[i].body_key == rb.grabs[i].body_key);
            if (ra.grabs[i].acquired)
                ++grabs;
        }
        const auto &ba = a.world().bodies();
        const auto &bb = b.world().bodies();
        assert(ba.size() == bb.size());
        for (std::size_t i = 0; i < ba.size(); ++i) {
            assert(ba[i].key == bb[i].key);
            assert(same_bits(a.world().transform(ba[i]), b.world().transform(bb[i])));
            b2Vec2 va = a.world().linear_velocity(ba[i]);
            b2Vec2 vb = b.world().linear_velocity(bb[i]);
            assert(std::memcmp(&va, &vb, sizeof(b2Vec2)) == 0);
        }
        for (std::size_t i = 0; i < a.players().size(); ++i) {
            assert(a.players()[i].cursor.x == b.players()[i].cursor.x);
            assert(a.players()[i].cursor.y == b.players()[i].cursor.y);
            assert(a.players()[i].alive == b.players()[i].alive);
        }
        assert(a.phase() == b.phase());
    }
    std::cout << "unit_physics_determinism OK (grabs=" << grabs << ")" << std::endl;
    return 0;
}
