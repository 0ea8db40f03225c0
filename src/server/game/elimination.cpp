// SPDX-License-Identifier: Apache-2.0
#include "server/game/elimination.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

namespace arena::game {

const char *to_string(EliminationCause c)
{
    return c == EliminationCause::Hazard ? "hazard" : "projectile";
}

std::optional<uint32_t> EliminationJudge::lethal_thrower_at(
    b2Vec2 p, uint32_t victim, const phys::PhysicsWorld &world) const
{
    // A projectile counts if it was lethal when the step began and its path crossed p,
    // even when it stopped against a wall later in that step.
    for (const auto &b : world.bodies()) {
        if (b.excluded || !b.swept_thrower || *b.swept_thrower == victim)
            continue;
        if (world.swept_contains(b, p))
            return b.swept_thrower;
    }
    return std::nullopt;
}

std::vector<EliminationRecord> EliminationJudge::evaluate(
    uint64_t tick, std::vector<Player> &players, phys::PhysicsWorld &world, const GrabController &grab)
{
    std::vector<EliminationRecord> out;
    for (auto &p : players) {
        if (!p.alive || p.spectator)
            continue;
        EliminationRecord rec{p.id, tick, EliminationCause::Hazard, std::nullopt};
        if (world.point_in_category(p.cursor, Category::Death)) {
            // hazard
        } else if (auto thrower = lethal_thrower_at(p.cursor, p.id, world)) {
            rec.cause = EliminationCause::Projectile;
            rec.killer = thrower;
        } else {
            continue;
        }
        p.alive = false;
        p.eliminated_tick = tick;
        grab.force_release(p, world);
        records_.push_back(rec);
        out.push_back(rec);
        metrics::inc(metrics::runtime().eliminations);
        log::info("[elim] player {} eliminated tick={} cause={} killer={}", p.id, tick, to_string(rec.cause),
            rec.killer.value_or(0));
    }
    return out;
}

} // namespace arena::game
