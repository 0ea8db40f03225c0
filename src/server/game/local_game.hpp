// SPDX-License-Identifier: Apache-2.0
// local_game.hpp - single-player simulation ticked by the caller's render loop
#pragma once
#include "arena.pb.h"
#include "server/game/match.hpp"

#include <memory>

namespace arena::game {

class LocalGame
{
public:
    static constexpr uint32_t kLocalPlayerId = 1;

    LocalGame(std::shared_ptr<const map::LoadedMap> map, const MatchConfig &cfg);

    // Advances one tick with this frame's input; a paused game ignores input and does not advance.
    void tick(float dx, float dy, bool mouse_down);
    arena::GameState game_state() const;
    // Toggles pause.
    void pause();
    bool paused() const { return paused_; }
    // Discards the world and rebuilds it from the same map.
    void restart();

    const Match &match() const { return *match_; }

private:
    std::shared_ptr<const map::LoadedMap> map_;
    MatchConfig cfg_;
    std::unique_ptr<Match> match_;
    bool paused_{false};
};

} // namespace arena::game
