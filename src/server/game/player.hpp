// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <box2d/math_functions.h>

#include <cstdint>
#include <deque>
#include <optional>

namespace arena::game {

enum class GrabPhase
{
    Idle,
    Grabbing
};

struct GrabState
{
    GrabPhase phase{GrabPhase::Idle};
    uint32_t body_key{0};
    b2Vec2 local_anchor{0.f, 0.f}; // tether point in the body frame
};

// Simulation side of a player; connection state lives in the session.
struct Player
{
    uint32_t id{0};
    b2Vec2 cursor{0.f, 0.f};
    bool alive{true};
    bool spectator{false}; // joined mid-match, never alive until the next match
    bool grab_input{false}; // current tick
    bool prev_grab_input{false};
    GrabState grab;
    std::deque<b2Vec2> recent_displacements; // newest at back
    std::optional<uint64_t> eliminated_tick;

    bool grabbing() const { return grab.phase == GrabPhase::Grabbing; }
};

} // namespace arena::game
