// SPDX-License-Identifier: Apache-2.0
#include "server/game/match.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <cmath>

namespace arena::game {

phys::PhysicsConfig make_physics_config(const MatchConfig &cfg, const map::LoadedMap &lm)
{
    phys::PhysicsConfig pc;
    pc.gravity = lm.gravity;
    pc.width = lm.width;
    pc.height = lm.height;
    pc.substeps = cfg.substeps;
    pc.max_tether_speed = cfg.max_tether_speed;
    pc.projectile_rest_speed = cfg.projectile_rest_speed;
    return pc;
}

ModeConfig make_mode_config(const MatchConfig &cfg, const map::LoadedMap &lm)
{
    ModeConfig mc;
    mc.kind = cfg.mode;
    mc.min_players = std::max<uint32_t>(cfg.min_players, 1);
    mc.lobby_countdown_ticks = cfg.lobby_countdown_ticks;
    mc.control_ticks_to_win =
        std::max<uint32_t>(1, static_cast<uint32_t>(std::lround(cfg.control_hold_seconds * float(cfg.tick_rate))));
    mc.time_limit_ticks = cfg.time_limit_seconds > 0.f
        ? static_cast<uint64_t>(std::llround(double(cfg.time_limit_seconds) * cfg.tick_rate))
        : 0;
    mc.draw_policy = cfg.draw_policy;
    mc.control_zone = lm.control_zone;
    if (cfg.mode == ModeKind::ControlPoint && !mc.control_zone) {
        // maps without an authored zone get a centered one
        mc.control_zone = map::Zone{{0.f, 0.f}, lm.width * 0.1f, lm.height * 0.1f};
        log::warn("[match] control point mode but map has no control_zone, using centered default");
    }
    return mc;
}

Match::Match(std::shared_ptr<const map::LoadedMap> loaded, const MatchConfig &cfg)
    : map_(std::move(loaded)),
      cfg_(cfg),
      world_(std::make_unique<phys::PhysicsWorld>(make_physics_config(cfg, *map_))),
      grab_(GrabConfig{cfg.grab_radius, cfg.fling_window_ticks, cfg.lethal_fling_speed, cfg.dt()}),
      mode_(make_mode_config(cfg, *map_))
{
    for (const auto &plan : map_->bodies)
        world_->add_body(plan, map_->registry);
}

const Player *Match::find_player(uint32_t id) const
{
    auto it = std::lower_bound(
        players_.begin(), players_.end(), id, [](const Player &p, uint32_t v) { return p.id < v; });
    return (it != players_.end() && it->id == id) ? &*it : nullptr;
}

Player *Match::find_player_mut(uint32_t id)
{
    return const_cast<Player *>(find_player(id));
}

void Match::add_player(uint32_t id)
{
    if (find_player(id))
        return;
    Player p;
    p.id = id;
    if (mode_.phase() != MatchPhase::Lobby) {
        p.spectator = true;
        p.alive = false;
    }
    auto it = std::lower_bound(
        players_.begin(), players_.end(), id, [](const Player &a, uint32_t v) { return a.id < v; });
    players_.insert(it, p);
    log::info("[match] player {} joined{}", id, p.spectator ? " as spectator" : "");
}

void Match::schedule_removal(uint32_t id)
{
    if (std::find(pending_removals_.begin(), pending_removals_.end(), id) == pending_removals_.end())
        pending_removals_.push_back(id);
}

void Match::apply_removals()
{
    for (auto id : pending_removals_) {
        Player *p = find_player_mut(id);
        if (!p)
            continue;
        grab_.force_release(*p, *world_);
        players_.erase(players_.begin() + (p - players_.data()));
        log::info("[match] player {} removed", id);
    }
    pending_removals_.clear();
}

b2Vec2 Match::clamp_to_map(b2Vec2 p) const
{
    // inner faces of the boundary walls
    float t = world_->config().wall_half_thickness;
    float hw = map_->width / 2.f - t;
    float hh = map_->height / 2.f - t;
    return {std::clamp(p.x, -hw, hw), std::clamp(p.y, -hh, hh)};
}

bool Match::is_over_grabbable(const Player &p) const
{
    if (!p.alive || p.spectator || p.grabbing())
        return false;
    std::vector<uint32_t> held;
    for (const auto &o : players_) {
        if (o.grabbing())
            held.push_back(o.grab.body_key);
    }
    return grab_.pick_candidate(p.cursor, *world_, held).has_value();
}

TickResult Match::tick(const std::vector<TickInput> &inputs)
{
    TickResult res;
    res.tick = ++server_tick_;
    if (mode_.phase() == MatchPhase::Ended) {
        apply_removals();
        return res;
    }

    for (auto &p : players_) {
        auto in = std::find_if(
            inputs.begin(), inputs.end(), [&](const TickInput &t) { return t.player_id == p.id; });
        b2Vec2 moved{0.f, 0.f};
        if (in != inputs.end()) {
            b2Vec2 next = clamp_to_map(b2Add(p.cursor, in->delta));
            moved = b2Sub(next, p.cursor);
            p.cursor = next;
            p.grab_input = in->grab;
        }
        grab_.record_displacement(p, moved);
    }

    res.grabs = grab_.update(players_, *world_);
    res.excluded_bodies = world_->step(cfg_.dt());
    if (!res.excluded_bodies.empty())
        grab_.release_bodies(players_, res.excluded_bodies, *world_);

    if (mode_.phase() == MatchPhase::Active)
        res.eliminated = judge_.evaluate(server_tick_, players_, *world_, grab_);

    mode_.update(server_tick_, players_, res.eliminated);
    res.started = mode_.started_this_tick();
    res.ended = mode_.ended_this_tick();
    if (res.ended) {
        for (auto &p : players_)
            grab_.force_release(p, *world_);
    }
    apply_removals();
    return res;
}

} // namespace arena::game
