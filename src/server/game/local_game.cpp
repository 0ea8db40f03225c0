// SPDX-License-Identifier: Apache-2.0
#include "server/game/local_game.hpp"

#include "common/logger.hpp"
#include "server/game/snapshot.hpp"

namespace arena::game {

LocalGame::LocalGame(std::shared_ptr<const map::LoadedMap> map, const MatchConfig &cfg) : map_(std::move(map)), cfg_(cfg)
{
    // no lobby with a single local player
    cfg_.min_players = 1;
    cfg_.lobby_countdown_ticks = 0;
    restart();
}

void LocalGame::tick(float dx, float dy, bool mouse_down)
{
    if (paused_)
        return;
    match_->tick({TickInput{kLocalPlayerId, {dx, dy}, mouse_down}});
}

arena::GameState LocalGame::game_state() const
{
    arena::GameState gs;
    build_game_state(*match_, gs);
    return gs;
}

void LocalGame::pause()
{
    paused_ = !paused_;
    log::debug("[local] paused={}", paused_);
}

void LocalGame::restart()
{
    match_ = std::make_unique<Match>(map_, cfg_);
    match_->add_player(kLocalPlayerId);
    paused_ = false;
}

} // namespace arena::game
