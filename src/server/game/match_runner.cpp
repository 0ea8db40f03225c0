// SPDX-License-Identifier: Apache-2.0
#include "server/game/match_runner.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/snapshot.hpp"

#include <chrono>

namespace arena::game {

MatchRunner::MatchRunner(
    std::shared_ptr<session::SessionManager> sessions, std::shared_ptr<map::MapStore> maps, const MatchConfig &cfg)
    : sessions_(std::move(sessions)), maps_(std::move(maps)), cfg_(cfg)
{
    start_match();
}

void MatchRunner::start_match()
{
    match_ = std::make_unique<Match>(maps_->current(), cfg_);
    match_end_sent_ = false;
    ended_at_tick_ = 0;
    ++matches_started_;
    metrics::runtime().active_matches.store(1, std::memory_order_relaxed);
    log::info("[match] #{} created mode={} bodies={}", matches_started_, to_string(cfg_.mode),
        match_->world().bodies().size());
}

StepReport MatchRunner::step()
{
    StepReport rep;
    // Sessions that joined or left since the previous tick. Departures are removed after this tick.
    for (auto id : sessions_->take_joined())
        match_->add_player(id);
    for (auto id : sessions_->take_departed())
        match_->schedule_removal(id);

    TickResult res = match_->tick(sessions_->drain_inputs());
    rep.tick = res.tick;

    for (const auto &rec : res.eliminated) {
        scratch_.Clear();
        build_eliminated(rec, *scratch_.mutable_eliminated());
        sessions_->broadcast(session::make_frame(scratch_));
    }
    if (res.ended && !match_end_sent_) {
        scratch_.Clear();
        build_match_end(*match_, *scratch_.mutable_match_end());
        sessions_->broadcast(session::make_frame(scratch_));
        match_end_sent_ = true;
        ended_at_tick_ = res.tick;
        rep.match_ended = true;
        metrics::inc(metrics::runtime().matches_completed);
    }

    scratch_.Clear();
    build_game_state(*match_, *scratch_.mutable_game_state());
    auto frame = session::make_frame(scratch_);
    if (frame) {
        rep.snapshot_bytes = frame->size();
        metrics::add_snapshot(frame->size());
        sessions_->broadcast(frame);
    }

    if (match_end_sent_ && res.tick - ended_at_tick_ >= cfg_.post_end_grace_ticks) {
        start_match();
        for (auto id : sessions_->connected_ids())
            match_->add_player(id);
        rep.new_match = true;
    }
    return rep;
}

coro::task<void> run_match_loop(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<MatchRunner> runner,
    uint32_t tick_rate, std::shared_ptr<std::atomic<bool>> running)
{
    co_await scheduler->schedule();
    if (tick_rate == 0)
        tick_rate = 60;
    using clock = std::chrono::steady_clock;
    // nanosecond interval avoids millisecond truncation (16.666ms at 60Hz)
    auto tick_interval = std::chrono::nanoseconds((1'000'000'000ull + tick_rate / 2) / tick_rate);
    auto next = clock::now();
    log::info("[match] loop start tick_rate={}", tick_rate);
    while (running->load(std::memory_order_relaxed)) {
        auto now = clock::now();
        if (now < next) {
            co_await scheduler->yield_for(next - now);
            continue;
        }
        auto tick_start = now;
        next += tick_interval;
        // fell far behind (debugger, suspend): resync instead of bursting
        if (now - next > tick_interval * 5)
            next = now + tick_interval;
        runner->step();
        auto tick_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - tick_start).count();
        metrics::add_tick_duration(static_cast<uint64_t>(tick_ns));
    }
    metrics::runtime().active_matches.store(0, std::memory_order_relaxed);
    log::info("[match] loop stopped");
}

} // namespace arena::game
