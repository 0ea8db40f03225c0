// SPDX-License-Identifier: Apache-2.0
#include "server/game/grab_controller.hpp"

#include "common/logger.hpp"

#include <algorithm>

namespace arena::game {

void GrabController::record_displacement(Player &p, b2Vec2 d) const
{
    p.recent_displacements.push_back(d);
    while (p.recent_displacements.size() > std::max<uint32_t>(cfg_.fling_window_ticks, 1))
        p.recent_displacements.pop_front();
}

b2Vec2 GrabController::fling_velocity(const Player &p) const
{
    if (p.recent_displacements.empty() || cfg_.dt <= 0.f)
        return {0.f, 0.f};
    b2Vec2 sum{0.f, 0.f};
    for (const auto &d : p.recent_displacements)
        sum = b2Add(sum, d);
    float n = static_cast<float>(p.recent_displacements.size());
    return b2MulSV(1.f / (n * cfg_.dt), sum);
}

std::optional<GrabEvent> GrabController::force_release(Player &p, phys::PhysicsWorld &world) const
{
    if (!p.grabbing())
        return std::nullopt;
    GrabEvent ev{p.id, p.grab.body_key, false, ReleaseKind::Forced, {0.f, 0.f}};
    world.end_hold(p.grab.body_key, std::nullopt);
    p.grab = GrabState{};
    log::debug("[grab] player {} force released body {}", ev.player_id, ev.body_key);
    return ev;
}

void GrabController::release_bodies(
    std::vector<Player> &players, const std::vector<uint32_t> &keys, phys::PhysicsWorld &world) const
{
    for (auto &p : players) {
        if (p.grabbing() && std::find(keys.begin(), keys.end(), p.grab.body_key) != keys.end())
            force_release(p, world);
    }
}

std::optional<uint32_t> GrabController::pick_candidate(
    b2Vec2 cursor, const phys::PhysicsWorld &world, const std::vector<uint32_t> &held) const
{
    std::optional<uint32_t> best_key;
    float best_dist = 0.f;
    uint32_t best_member = 0;
    for (const auto &b : world.bodies()) {
        if (b.is_static || b.excluded || !b.has_grabbable)
            continue;
        if (std::find(held.begin(), held.end(), b.key) != held.end())
            continue;
        uint32_t member = 0;
        auto d = world.distance_to_category(b, cursor, Category::Grabbable, &member);
        if (!d || *d > cfg_.grab_radius)
            continue;
        if (!best_key || *d < best_dist || (*d == best_dist && member < best_member)) {
            best_key = b.key;
            best_dist = *d;
            best_member = member;
        }
    }
    return best_key;
}

std::vector<GrabEvent> GrabController::update(std::vector<Player> &players, phys::PhysicsWorld &world)
{
    std::vector<GrabEvent> events;

    for (auto &p : players) {
        if (!p.grabbing())
            continue;
        const phys::Body *b = world.find(p.grab.body_key);
        if (!p.alive || !b || b->excluded) {
            if (auto ev = force_release(p, world))
                events.push_back(*ev);
            continue;
        }
        if (!p.grab_input) {
            b2Vec2 v = fling_velocity(p);
            world.end_hold(p.grab.body_key, v);
            if (b2Length(v) >= cfg_.lethal_fling_speed) {
                world.mark_lethal(p.grab.body_key, p.id);
                log::debug("[grab] player {} flung body {} lethal speed={}", p.id, p.grab.body_key, b2Length(v));
            }
            events.push_back({p.id, p.grab.body_key, false, ReleaseKind::Voluntary, v});
            p.grab = GrabState{};
        }
    }

    std::vector<uint32_t> held;
    for (const auto &p : players) {
        if (p.grabbing())
            held.push_back(p.grab.body_key);
    }
    // Each request resolves against the hold set as it stands after releases. When two
    // requests resolve to the same body, ascending player order gives it to the lower id
    // and the other request fails.
    std::vector<uint32_t> taken;
    for (auto &p : players) {
        bool rising = p.grab_input && !p.prev_grab_input;
        if (!rising || !p.alive || p.spectator || p.grabbing())
            continue;
        auto key = pick_candidate(p.cursor, world, held);
        if (!key)
            continue;
        if (std::find(taken.begin(), taken.end(), *key) != taken.end()) {
            log::trace("[grab] player {} lost body {} to a lower id", p.id, *key);
            continue;
        }
        const phys::Body *b = world.find(*key);
        p.grab.phase = GrabPhase::Grabbing;
        p.grab.body_key = *key;
        p.grab.local_anchor = world.local_point(*b, p.cursor);
        world.begin_hold(*key);
        taken.push_back(*key);
        events.push_back({p.id, *key, true, ReleaseKind::Voluntary, {0.f, 0.f}});
        log::trace("[grab] player {} grabbed body {}", p.id, *key);
    }

    for (auto &p : players) {
        if (p.grabbing())
            world.set_tether(p.grab.body_key, p.grab.local_anchor, p.cursor);
        p.prev_grab_input = p.grab_input;
    }
    return events;
}

} // namespace arena::game
