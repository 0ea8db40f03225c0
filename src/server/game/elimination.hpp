// SPDX-License-Identifier: Apache-2.0
#pragma once
#include "server/game/grab_controller.hpp"
#include "server/game/physics.hpp"
#include "server/game/player.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace arena::game {

enum class EliminationCause
{
    Hazard, // cursor inside a Death member
    Projectile // cursor on the path of a lethal body flung by another player
};

const char *to_string(EliminationCause c);

struct EliminationRecord
{
    uint32_t player_id{0};
    uint64_t tick{0};
    EliminationCause cause{EliminationCause::Hazard};
    std::optional<uint32_t> killer; // thrower, for projectile kills
};

class EliminationJudge
{
public:
    // Tests every alive player in ascending id. Hits are marked eliminated, their grab is
    // force released and a record is appended. Returns this tick's records.
    std::vector<EliminationRecord> evaluate(
        uint64_t tick, std::vector<Player> &players, phys::PhysicsWorld &world, const GrabController &grab);

    // Ordered, append-only.
    const std::vector<EliminationRecord> &records() const { return records_; }

private:
    std::optional<uint32_t> lethal_thrower_at(b2Vec2 p, uint32_t victim, const phys::PhysicsWorld &world) const;

    std::vector<EliminationRecord> records_;
};

} // namespace arena::game
