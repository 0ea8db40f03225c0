// SPDX-License-Identifier: Apache-2.0
// Authoring boundary: each run gets its own build context, handlers fire in
// registration order per event kind, failures leave the installed map untouched.
#include "server/map/authoring.hpp"
#include "server/map/map_store.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace arena;
using map::AuthoringEvent;
using map::PropertyTable;

namespace {

class ArenaScript : public map::AuthoringHost
{
public:
    int runs{0};

    void run(map::MapBuildContext &ctx, map::AuthoringHandlerTable &handlers) override
    {
        ++runs;
        ctx.set_gravity(0.f, -5.f);
        ctx.set_map_dimensions(20.f, 10.f);
        ctx.set_cursor_size(0.25f);
        ctx.create_entity(PropertyTable{{"shape", std::string("rect")}, {"x1", 0.0}, {"y1", 0.0}, {"x2", 1.0},
            {"y2", 0.05}, {"is_static", true}});
        ctx.create_entity(PropertyTable{{"shape", std::string("circle")}, {"x", 0.5}, {"y", 0.5}, {"radius", 0.02},
            {"restitution", 0.5}, {"color", std::string("red")}});
        handlers.on(AuthoringEvent::PointerClick, [](map::MapBuildContext &c, const map::AuthoringEventArgs &a) {
            c.create_entity(PropertyTable{{"shape", std::string("circle")}, {"x", double(a.point.x)},
                {"y", double(a.point.y)}, {"radius", 0.01}, {"id", 100.0}});
        });
        handlers.on(AuthoringEvent::PointerClick, [](map::MapBuildContext &c, const map::AuthoringEventArgs &a) {
            c.create_entity(PropertyTable{{"shape", std::string("circle")}, {"x", double(a.point.x)},
                {"y", double(a.point.y) + 0.05}, {"radius", 0.01}, {"id", 101.0}, {"parent", 100.0}});
        });
        handlers.on(AuthoringEvent::ObjectCollision, [](map::MapBuildContext &, const map::AuthoringEventArgs &a) {
            if (a.entity_a == a.entity_b)
                throw std::runtime_error("self collision");
        });
    }
};

class BrokenScript : public map::AuthoringHost
{
public:
    void run(map::MapBuildContext &ctx, map::AuthoringHandlerTable &) override
    {
        ctx.create_entity(PropertyTable{{"shape", std::string("rect")}});
        throw std::runtime_error("syntax error at line 3");
    }
};

class BadPropertyScript : public map::AuthoringHost
{
public:
    void run(map::MapBuildContext &ctx, map::AuthoringHandlerTable &) override
    {
        ctx.create_entity(PropertyTable{{"shape", std::string("circle")}, {"x", std::string("left")}});
    }
};

class CyclicScript : public map::AuthoringHost
{
public:
    void run(map::MapBuildContext &ctx, map::AuthoringHandlerTable &) override
    {
        ctx.create_entity(
            PropertyTable{{"shape", std::string("circle")}, {"x", 0.2}, {"y", 0.2}, {"id", 1.0}, {"parent", 2.0}});
        ctx.create_entity(
            PropertyTable{{"shape", std::string("circle")}, {"x", 0.4}, {"y", 0.2}, {"id", 2.0}, {"parent", 1.0}});
    }
};

} // namespace

int main()
{
    ArenaScript script;
    auto first = map::run_authoring(script);
    auto second = map::run_authoring(script);
    assert(first && second);
    assert(script.runs == 2);
    // no state leaks between runs
    assert(first->document.entities.size() == 2);
    assert(second->document.entities.size() == 2);
    assert(first->document.gravity.y == -5.f && first->document.width == 20.f);
    assert(first->document.cursor_size == 0.25f);
    assert(first->document.entities[0].is_static);
    assert(first->document.entities[1].restitution == 0.5f);
    assert(first->handlers.count(AuthoringEvent::PointerClick) == 2);
    assert(first->handlers.count(AuthoringEvent::ObjectCollision) == 1);

    // click handlers run in registration order
    assert(map::dispatch_authoring_event(*first, AuthoringEvent::PointerClick, {{0.3f, 0.6f}, 0, 0}));
    const auto &ents = first->document.entities;
    assert(ents.size() == 4);
    assert(ents[2].id == 100u && ents[3].id == 101u && ents[3].parent == 100u);
    assert(second->document.entities.size() == 2);

    // a throwing handler leaves the document as it was
    assert(!map::dispatch_authoring_event(*first, AuthoringEvent::ObjectCollision, {{0.f, 0.f}, 7, 7}));
    assert(first->document.entities.size() == 4);
    assert(map::dispatch_authoring_event(*first, AuthoringEvent::ObjectCollision, {{0.f, 0.f}, 7, 8}));

    // bad dimensions are a script failure
    map::MapBuildContext ctx;
    bool threw = false;
    try {
        ctx.set_map_dimensions(0.f, 10.f);
    } catch (const map::MapError &e) {
        threw = e.kind == map::ErrorKind::AuthoringScriptFailure;
    }
    assert(threw);

    BrokenScript broken;
    assert(!map::run_authoring(broken));
    BadPropertyScript bad_prop;
    assert(!map::run_authoring(bad_prop));

    // the store keeps the previous map when a run or its document fails
    map::MapStore store;
    assert(!store.current());
    assert(store.install_from(script));
    auto installed = store.current();
    assert(installed && installed->width == 20.f);
    assert(installed->bodies.size() == 2);
    assert(!store.install_from(broken));
    assert(store.current() == installed);
    CyclicScript cyclic;
    assert(map::run_authoring(cyclic)); // the script itself succeeds
    assert(!store.install_from(cyclic)); // its topology does not
    assert(store.current() == installed);
    assert(store.install(first->document));
    assert(store.current() != installed);
    assert(store.current()->bodies.size() == 3); // 100 and 101 form one body

    std::cout << "unit_authoring OK" << std::endl;
    return 0;
}
