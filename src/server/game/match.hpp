// SPDX-License-Identifier: Apache-2.0
// match.hpp - authoritative per-match simulation: roster, physics, grab, elimination, mode
#pragma once
#include "server/game/elimination.hpp"
#include "server/game/game_mode.hpp"
#include "server/game/grab_controller.hpp"
#include "server/game/physics.hpp"
#include "server/game/player.hpp"
#include "server/map/map_loader.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace arena::game {

struct MatchConfig
{
    uint32_t tick_rate{60};
    int substeps{4};
    float grab_radius{0.05f};
    uint32_t fling_window_ticks{3};
    float lethal_fling_speed{6.f}; // minimum release speed for a lethal fling
    float projectile_rest_speed{0.25f};
    float max_tether_speed{60.f};
    ModeKind mode{ModeKind::LastManStanding};
    uint32_t min_players{2};
    uint32_t lobby_countdown_ticks{180};
    uint32_t post_end_grace_ticks{60};
    float control_hold_seconds{5.f};
    float time_limit_seconds{0.f}; // 0 = unlimited
    DrawPolicy draw_policy{DrawPolicy::DrawAmongSimultaneous};

    float dt() const { return 1.f / static_cast<float>(tick_rate ? tick_rate : 60); }
};

// One player's consumed input for a tick.
struct TickInput
{
    uint32_t player_id{0};
    b2Vec2 delta{0.f, 0.f};
    bool grab{false};
};

struct TickResult
{
    uint64_t tick{0};
    std::vector<GrabEvent> grabs;
    std::vector<EliminationRecord> eliminated;
    std::vector<uint32_t> excluded_bodies;
    bool started{false};
    bool ended{false};
};

class Match
{
public:
    Match(std::shared_ptr<const map::LoadedMap> loaded, const MatchConfig &cfg);

    // Joins during Active/Ended become spectators until the next match.
    void add_player(uint32_t id);
    // Removal happens after the current (or next) tick completes.
    void schedule_removal(uint32_t id);

    // One authoritative tick. Inputs for unknown players are ignored; players with no
    // entry keep their grab flag and do not move. Ticks after Ended only advance the counter.
    TickResult tick(const std::vector<TickInput> &inputs);

    // True when p is over a body the player could grab right now.
    bool is_over_grabbable(const Player &p) const;

    uint64_t server_tick() const { return server_tick_; }
    MatchPhase phase() const { return mode_.phase(); }
    const MatchOutcome &outcome() const { return mode_.outcome(); }
    const GameModeController &mode() const { return mode_; }
    const std::vector<Player> &players() const { return players_; }
    const Player *find_player(uint32_t id) const;
    const std::vector<EliminationRecord> &elimination_log() const { return judge_.records(); }
    const phys::PhysicsWorld &world() const { return *world_; }
    phys::PhysicsWorld &world() { return *world_; }
    const map::LoadedMap &loaded_map() const { return *map_; }
    const MatchConfig &config() const { return cfg_; }

private:
    Player *find_player_mut(uint32_t id);
    b2Vec2 clamp_to_map(b2Vec2 p) const;
    void apply_removals();

    std::shared_ptr<const map::LoadedMap> map_;
    MatchConfig cfg_;
    std::unique_ptr<phys::PhysicsWorld> world_;
    GrabController grab_;
    EliminationJudge judge_;
    GameModeController mode_;
    std::vector<Player> players_; // ascending id
    std::vector<uint32_t> pending_removals_;
    uint64_t server_tick_{0};
};

ModeConfig make_mode_config(const MatchConfig &cfg, const map::LoadedMap &lm);
phys::PhysicsConfig make_physics_config(const MatchConfig &cfg, const map::LoadedMap &lm);

} // namespace arena::game
