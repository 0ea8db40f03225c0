// SPDX-License-Identifier: Apache-2.0
// match_runner.hpp - fixed-rate tick driver: sessions -> Match -> snapshot broadcast
#pragma once
#include "arena.pb.h"
#include "server/game/match.hpp"
#include "server/map/map_store.hpp"
#include "server/session/session_manager.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <cstdint>
#include <memory>

namespace arena::game {

struct StepReport
{
    uint64_t tick{0};
    std::size_t snapshot_bytes{0};
    bool match_ended{false};
    bool new_match{false};
};

// Owns the current match and performs one complete tick per step(). Rolls over to a
// new match (same map store, connected sessions) once the post-end grace elapses.
class MatchRunner
{
public:
    MatchRunner(std::shared_ptr<session::SessionManager> sessions, std::shared_ptr<map::MapStore> maps,
        const MatchConfig &cfg);

    StepReport step();

    const Match &match() const { return *match_; }
    uint32_t matches_started() const { return matches_started_; }

private:
    void start_match();

    std::shared_ptr<session::SessionManager> sessions_;
    std::shared_ptr<map::MapStore> maps_;
    MatchConfig cfg_;
    std::unique_ptr<Match> match_;
    uint32_t matches_started_{0};
    bool match_end_sent_{false};
    uint64_t ended_at_tick_{0};
    arena::ServerMessage scratch_;
};

// Drives runner->step() at cfg.tick_rate on the scheduler until `running` turns false.
coro::task<void> run_match_loop(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<MatchRunner> runner,
    uint32_t tick_rate, std::shared_ptr<std::atomic<bool>> running);

} // namespace arena::game
