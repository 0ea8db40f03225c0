// SPDX-License-Identifier: Apache-2.0
// grab_controller.hpp - per-player grab / fling state machine driving cursor tethers
#pragma once
#include "server/game/physics.hpp"
#include "server/game/player.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace arena::game {

struct GrabConfig
{
    float grab_radius{0.05f};
    uint32_t fling_window_ticks{3};
    float lethal_fling_speed{6.f};
    float dt{1.f / 60.f};
};

enum class ReleaseKind
{
    Voluntary,
    Forced
};

struct GrabEvent
{
    uint32_t player_id{0};
    uint32_t body_key{0};
    bool acquired{false}; // false: release
    ReleaseKind release{ReleaseKind::Voluntary};
    b2Vec2 fling_velocity{0.f, 0.f};
};

class GrabController
{
public:
    explicit GrabController(const GrabConfig &cfg) : cfg_(cfg) {}

    // Records this tick's actual cursor displacement into the fling window.
    void record_displacement(Player &p, b2Vec2 d) const;
    b2Vec2 fling_velocity(const Player &p) const;

    // One tick of the state machine. `players` must be sorted by id. Releases run
    // first, then acquisitions (ties to the lower player id), then tethers are
    // queued on the world in ascending player order.
    std::vector<GrabEvent> update(std::vector<Player> &players, phys::PhysicsWorld &world);

    // Forced release (elimination, disconnect, excluded body, match end). No velocity imparted.
    std::optional<GrabEvent> force_release(Player &p, phys::PhysicsWorld &world) const;
    // Forced release of every player whose held body is listed.
    void release_bodies(std::vector<Player> &players, const std::vector<uint32_t> &keys, phys::PhysicsWorld &world) const;

    // Nearest grabbable body within the grab radius of `cursor`, ignoring bodies in `held`.
    // Distance ties go to the lowest member entity id.
    std::optional<uint32_t> pick_candidate(
        b2Vec2 cursor, const phys::PhysicsWorld &world, const std::vector<uint32_t> &held) const;

    const GrabConfig &config() const { return cfg_; }

private:
    GrabConfig cfg_;
};

} // namespace arena::game
