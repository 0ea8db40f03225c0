// SPDX-License-Identifier: Apache-2.0
// game_mode.hpp - match phase machine and win conditions
#pragma once
#include "server/game/elimination.hpp"
#include "server/game/player.hpp"
#include "server/map/map_loader.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace arena::game {

enum class MatchPhase
{
    Lobby,
    Active,
    Ended
};

enum class ModeKind
{
    LastManStanding,
    ControlPoint
};

// What happens when every remaining alive player is eliminated in the same tick.
enum class DrawPolicy
{
    DrawAmongSimultaneous, // draw shared by the players eliminated that tick
    NoContest // draw with no participants
};

const char *to_string(MatchPhase p);
const char *to_string(ModeKind m);

struct ModeConfig
{
    ModeKind kind{ModeKind::LastManStanding};
    uint32_t min_players{2};
    uint32_t lobby_countdown_ticks{180};
    uint32_t control_ticks_to_win{300};
    uint64_t time_limit_ticks{0}; // 0 = no limit
    DrawPolicy draw_policy{DrawPolicy::DrawAmongSimultaneous};
    std::optional<map::Zone> control_zone;
};

enum class OutcomeKind
{
    None,
    Winner,
    Draw
};

struct MatchOutcome
{
    OutcomeKind kind{OutcomeKind::None};
    uint32_t winner{0};
    std::vector<uint32_t> draw_players;
    uint64_t tick{0};
};

class GameModeController
{
public:
    explicit GameModeController(const ModeConfig &cfg) : cfg_(cfg) {}

    // Runs after elimination. `eliminated` holds this tick's records only.
    void update(uint64_t tick, const std::vector<Player> &players, const std::vector<EliminationRecord> &eliminated);

    MatchPhase phase() const { return phase_; }
    const MatchOutcome &outcome() const { return outcome_; }
    bool started_this_tick() const { return started_now_; }
    bool ended_this_tick() const { return ended_now_; }
    uint64_t active_since() const { return active_since_; }
    uint32_t starting_players() const { return starting_players_; }

    // Control Point accumulator
    uint32_t occupant() const { return occupant_; }
    uint32_t held_ticks() const { return held_ticks_; }
    const ModeConfig &config() const { return cfg_; }

private:
    void update_lms(uint64_t tick, const std::vector<Player> &players, const std::vector<EliminationRecord> &eliminated);
    void update_control(
        uint64_t tick, const std::vector<Player> &players, const std::vector<EliminationRecord> &eliminated);
    bool check_wipeout(uint64_t tick, std::size_t alive, const std::vector<EliminationRecord> &eliminated);
    void end(uint64_t tick, MatchOutcome o);

    ModeConfig cfg_;
    MatchPhase phase_{MatchPhase::Lobby};
    MatchOutcome outcome_;
    uint32_t lobby_ticks_{0};
    uint64_t active_since_{0};
    uint32_t starting_players_{0};
    uint32_t occupant_{0};
    uint32_t held_ticks_{0};
    bool started_now_{false};
    bool ended_now_{false};
};

} // namespace arena::game
