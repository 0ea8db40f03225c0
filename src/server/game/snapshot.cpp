// SPDX-License-Identifier: Apache-2.0
#include "server/game/snapshot.hpp"

namespace arena::game {

static arena::MatchPhase to_proto(MatchPhase p)
{
    switch (p) {
        case MatchPhase::Lobby:
            return arena::LOBBY;
        case MatchPhase::Active:
            return arena::ACTIVE;
        case MatchPhase::Ended:
            return arena::ENDED;
    }
    return arena::LOBBY;
}

void build_game_state(const Match &m, arena::GameState &out)
{
    out.Clear();
    out.set_server_tick(m.server_tick());
    out.set_phase(to_proto(m.phase()));
    out.set_cursor_size(m.loaded_map().cursor_size);
    const auto &world = m.world();
    for (const auto &b : world.boundaries()) {
        auto *pb = out.add_boundaries();
        pb->set_x(b.center.x);
        pb->set_y(b.center.y);
        pb->set_half_width(b.half_width);
        pb->set_half_height(b.half_height);
    }
    for (const auto &body : world.bodies()) {
        if (body.excluded)
            continue;
        for (const auto &pose : world.member_poses(body)) {
            const auto &shape = pose.member->shape;
            auto *o = out.add_objects();
            o->set_id(pose.member->entity_id);
            o->set_x(pose.position.x);
            o->set_y(pose.position.y);
            o->set_rotation(pose.rotation);
            o->set_user_data(pose.member->user_data);
            if (shape.kind == ShapeKind::Rectangle) {
                o->set_shape(arena::SQUARE);
                o->set_half_width(shape.half_width);
                o->set_half_height(shape.half_height);
            } else {
                o->set_shape(arena::CIRCLE);
                o->set_radius(shape.radius);
            }
        }
    }
    for (const auto &p : m.players()) {
        auto *ps = out.add_players();
        ps->set_id(p.id);
        ps->set_x(p.cursor.x);
        ps->set_y(p.cursor.y);
        ps->set_is_grabbing(p.grabbing());
        ps->set_is_over_grabbable(m.is_over_grabbable(p));
        ps->set_alive(p.alive);
    }
    const auto &mode = m.mode();
    if (mode.config().kind == ModeKind::ControlPoint && mode.config().control_zone) {
        const auto &z = *mode.config().control_zone;
        auto *cz = out.mutable_control_zone();
        cz->set_x(z.center.x);
        cz->set_y(z.center.y);
        cz->set_half_width(z.half_width);
        cz->set_half_height(z.half_height);
        cz->set_occupant_id(mode.occupant());
        cz->set_held_ticks(mode.held_ticks());
        cz->set_ticks_to_win(mode.config().control_ticks_to_win);
    }
}

void build_match_end(const Match &m, arena::MatchEnd &out)
{
    out.Clear();
    const auto &o = m.outcome();
    out.set_winner_id(o.kind == OutcomeKind::Winner ? o.winner : 0);
    for (auto id : o.draw_players)
        out.add_draw_ids(id);
    for (const auto &r : m.elimination_log())
        out.add_elimination_order(r.player_id);
    out.set_server_tick(o.tick);
}

void build_eliminated(const EliminationRecord &r, arena::PlayerEliminated &out)
{
    out.Clear();
    out.set_player_id(r.player_id);
    out.set_killer_id(r.killer.value_or(0));
    out.set_server_tick(r.tick);
}

} // namespace arena::game
