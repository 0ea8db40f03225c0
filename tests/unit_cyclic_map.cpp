// SPDX-License-Identifier: Apache-2.0
// Parent cycles reject the whole document; acyclic chains collapse into one body.
#include "server/game/composite_builder.hpp"
#include "server/map/map_document.hpp"
#include "server/map/map_loader.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace arena;

static bool rejected_as_topology(const std::string &text)
{
    std::vector<map::LoadWarning> w;
    auto doc = map::parse_map_string(text, w);
    try {
        auto lm = map::load_map(doc);
        (void)lm;
    } catch (const map::MapError &e) {
        return e.kind == map::ErrorKind::InvalidMapTopology;
    }
    return false;
}

int main()
{
    // E1 -> E2 -> E1
    assert(rejected_as_topology(R"(
entities:
  - {id: 1, shape: rect, x1: 0.1, y1: 0.1, x2: 0.2, y2: 0.2, parent: 2}
  - {id: 2, shape: rect, x1: 0.3, y1: 0.1, x2: 0.4, y2: 0.2, parent: 1}
  - {id: 3, shape: circle, x: 0.7, y: 0.7}
)"));

    // self-parent
    assert(rejected_as_topology(R"(
entities:
  - {id: 5, shape: circle, x: 0.5, y: 0.5, parent: 5}
)"));

    // longer cycle hanging off a valid chain
    assert(rejected_as_topology(R"(
entities:
  - {id: 1, shape: circle, x: 0.1, y: 0.1}
  - {id: 2, shape: circle, x: 0.2, y: 0.1, parent: 1}
  - {id: 3, shape: circle, x: 0.3, y: 0.1, parent: 5}
  - {id: 4, shape: circle, x: 0.4, y: 0.1, parent: 3}
  - {id: 5, shape: circle, x: 0.5, y: 0.1, parent: 4}
)"));

    // acyclic chain 3 -> 2 -> 1 plus a sibling: one body keyed by the root
    std::vector<map::LoadWarning> w;
    auto doc = map::parse_map_string(R"(
entities:
  - {id: 1, shape: rect, x1: 0.4, y1: 0.4, x2: 0.5, y2: 0.5}
  - {id: 2, shape: rect, x1: 0.5, y1: 0.4, x2: 0.6, y2: 0.5, parent: 1}
  - {id: 3, shape: circle, x: 0.65, y: 0.45, radius: 0.02, parent: 2}
  - {id: 4, shape: circle, x: 0.45, y: 0.6, radius: 0.02, parent: 1}
  - {id: 9, shape: circle, x: 0.9, y: 0.9, radius: 0.02}
)",
        w);
    auto lm = map::load_map(doc);
    assert(lm.bodies.size() == 2);
    assert(lm.bodies[0].key == 1 && lm.bodies[0].members.size() == 4);
    assert(lm.bodies[1].key == 9 && lm.bodies[1].members.size() == 1);
    for (std::size_t i = 1; i < lm.bodies[0].members.size(); ++i)
        assert(lm.bodies[0].members[i - 1].entity_id < lm.bodies[0].members[i].entity_id);

    // the builder itself rejects a registry with a cycle
    game::EntityRegistry reg;
    game::Entity a;
    a.id = 10;
    a.shape = game::Shape{game::ShapeKind::Circle, 0.f, 0.f, 0.5f};
    a.parent = 11;
    game::Entity b = a;
    b.id = 11;
    b.parent = 10;
    assert(reg.add(a) && reg.add(b));
    assert(!reg.add(a)); // duplicate id
    bool threw = false;
    try {
        game::build_bodies(reg);
    } catch (const map::MapError &e) {
        threw = e.kind == map::ErrorKind::InvalidMapTopology;
    }
    assert(threw);

    // union-find basics
    game::UnionFind uf(6);
    uf.unite(0, 1);
    uf.unite(2, 3);
    uf.unite(1, 3);
    assert(uf.find(0) == uf.find(2));
    assert(uf.find(4) != uf.find(0));
    assert(uf.find(5) == 5);

    std::cout << "unit_cyclic_map OK" << std::endl;
    return 0;
}
