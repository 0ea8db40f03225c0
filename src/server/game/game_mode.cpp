// SPDX-License-Identifier: Apache-2.0
#include "server/game/game_mode.hpp"

#include "common/logger.hpp"

#include <algorithm>

namespace arena::game {

const char *to_string(MatchPhase p)
{
    switch (p) {
        case MatchPhase::Lobby:
            return "lobby";
        case MatchPhase::Active:
            return "active";
        case MatchPhase::Ended:
            return "ended";
    }
    return "?";
}

const char *to_string(ModeKind m)
{
    return m == ModeKind::LastManStanding ? "last_man_standing" : "control_point";
}

static std::size_t count_alive(const std::vector<Player> &players)
{
    return std::count_if(players.begin(), players.end(), [](const Player &p) { return p.alive && !p.spectator; });
}

void GameModeController::end(uint64_t tick, MatchOutcome o)
{
    o.tick = tick;
    outcome_ = std::move(o);
    phase_ = MatchPhase::Ended;
    ended_now_ = true;
    if (outcome_.kind == OutcomeKind::Winner)
        log::info("[mode] match ended tick={} winner={}", tick, outcome_.winner);
    else
        log::info("[mode] match ended tick={} draw among {} players", tick, outcome_.draw_players.size());
}

void GameModeController::update(
    uint64_t tick, const std::vector<Player> &players, const std::vector<EliminationRecord> &eliminated)
{
    started_now_ = false;
    ended_now_ = false;
    if (phase_ == MatchPhase::Ended)
        return;

    if (phase_ == MatchPhase::Lobby) {
        if (players.size() >= cfg_.min_players && cfg_.min_players > 0)
            ++lobby_ticks_;
        else
            lobby_ticks_ = 0;
        if (lobby_ticks_ > 0 && lobby_ticks_ >= cfg_.lobby_countdown_ticks) {
            phase_ = MatchPhase::Active;
            active_since_ = tick;
            starting_players_ = static_cast<uint32_t>(count_alive(players));
            started_now_ = true;
            log::info("[mode] match active tick={} mode={} players={}", tick, to_string(cfg_.kind), starting_players_);
        }
        return;
    }

    if (cfg_.kind == ModeKind::LastManStanding)
        update_lms(tick, players, eliminated);
    else
        update_control(tick, players, eliminated);
    if (phase_ == MatchPhase::Ended)
        return;

    if (cfg_.time_limit_ticks > 0 && tick - active_since_ >= cfg_.time_limit_ticks) {
        MatchOutcome o;
        o.kind = OutcomeKind::Draw;
        for (const auto &p : players) {
            if (p.alive && !p.spectator)
                o.draw_players.push_back(p.id);
        }
        log::info("[mode] time limit reached");
        end(tick, std::move(o));
    }
}

// Alive count reached zero. Returns true when the match ended.
bool GameModeController::check_wipeout(
    uint64_t tick, std::size_t alive, const std::vector<EliminationRecord> &eliminated)
{
    if (alive != 0)
        return false;
    MatchOutcome o;
    o.kind = OutcomeKind::Draw;
    if (cfg_.draw_policy == DrawPolicy::DrawAmongSimultaneous) {
        for (const auto &r : eliminated)
            o.draw_players.push_back(r.player_id);
        std::sort(o.draw_players.begin(), o.draw_players.end());
    }
    end(tick, std::move(o));
    return true;
}

void GameModeController::update_lms(
    uint64_t tick, const std::vector<Player> &players, const std::vector<EliminationRecord> &eliminated)
{
    std::size_t alive = count_alive(players);
    if (check_wipeout(tick, alive, eliminated))
        return;
    if (alive == 1 && starting_players_ >= 2) {
        auto it = std::find_if(players.begin(), players.end(), [](const Player &p) { return p.alive && !p.spectator; });
        MatchOutcome o;
        o.kind = OutcomeKind::Winner;
        o.winner = it->id;
        end(tick, std::move(o));
    }
}

void GameModeController::update_control(
    uint64_t tick, const std::vector<Player> &players, const std::vector<EliminationRecord> &eliminated)
{
    if (check_wipeout(tick, count_alive(players), eliminated))
        return;
    uint32_t sole = 0;
    int inside = 0;
    if (cfg_.control_zone) {
        for (const auto &p : players) {
            if (p.alive && !p.spectator && cfg_.control_zone->contains(p.cursor)) {
                ++inside;
                sole = p.id;
            }
        }
    }
    if (inside != 1) {
        occupant_ = 0;
        held_ticks_ = 0;
        return;
    }
    if (sole != occupant_) {
        occupant_ = sole;
        held_ticks_ = 0;
    }
    ++held_ticks_;
    if (held_ticks_ >= cfg_.control_ticks_to_win) {
        MatchOutcome o;
        o.kind = OutcomeKind::Winner;
        o.winner = occupant_;
        end(tick, std::move(o));
    }
}

} // namespace arena::game
