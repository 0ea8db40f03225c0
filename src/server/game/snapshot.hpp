// SPDX-License-Identifier: Apache-2.0
#pragma once
#include "arena.pb.h"
#include "server/game/match.hpp"

namespace arena::game {

// Full world snapshot: one object per member shape of every non-excluded body.
void build_game_state(const Match &m, arena::GameState &out);

void build_match_end(const Match &m, arena::MatchEnd &out);
void build_eliminated(const EliminationRecord &r, arena::PlayerEliminated &out);

} // namespace arena::game
