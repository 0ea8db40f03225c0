// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/config/server_config.hpp"
#include "server/game/match_runner.hpp"
#include "server/map/map_document.hpp"
#include "server/map/map_store.hpp"
#include "server/net/listener.hpp"
#include "server/session/session_manager.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace arena {

std::atomic_bool g_shutdown{false};

} // namespace arena

static coro::task<void> idle_monitor(std::shared_ptr<coro::io_scheduler> sched,
    std::shared_ptr<arena::session::SessionManager> sessions, uint32_t timeout_sec)
{
    co_await sched->schedule();
    while (!arena::g_shutdown.load()) {
        auto expired = sessions->expire_idle(std::chrono::steady_clock::now(), std::chrono::seconds(timeout_sec));
        for (auto &s : expired)
            arena::log::warn("[idle] disconnect timeout {} player={}", s->connection_id, s->player_id);
        co_await sched->yield_for(std::chrono::seconds(1));
    }
}

static void handle_signal(int)
{
    arena::g_shutdown.store(true);
}

int main(int argc, char **argv)
{
    arena::ServerConfig cfg;
    std::string config_path = "config/server.yaml";
    bool cli_port_override = false;
    uint16_t port_override = 0;
    std::string map_override;
    std::string mode_override;
    int duration_override_sec = 0; // 0 = run until signal
    bool print_map = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port" && i + 1 < argc) {
            try {
                port_override = static_cast<uint16_t>(std::stoi(argv[++i]));
                cli_port_override = true;
            } catch (const std::exception &) {
                arena::log::warn("Invalid --port value '{}', ignoring", argv[i]);
            }
        } else if (a == "--duration" && i + 1 < argc) {
            try {
                duration_override_sec = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                arena::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (a == "--map" && i + 1 < argc) {
            map_override = argv[++i];
        } else if (a == "--mode" && i + 1 < argc) {
            mode_override = argv[++i];
        } else if (a == "--print-map") {
            print_map = true;
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        }
    }

    try {
        cfg = arena::load_server_config(config_path);
        if (!mode_override.empty())
            cfg.mode = arena::parse_mode(mode_override);
    } catch (const std::exception &ex) {
        arena::log::error("Failed to load config: {}", ex.what());
        arena::log::flush();
        return 1;
    }
    if (!map_override.empty())
        cfg.map_path = map_override;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    // an explicit ARENA_LOG_LEVEL in the environment wins over the file
    if (!cfg.log_level.empty() && std::getenv("ARENA_LOG_LEVEL") == nullptr)
        setenv("ARENA_LOG_LEVEL", cfg.log_level.c_str(), 1);
    if (cfg.log_json)
        setenv("ARENA_LOG_JSON", "1", 1);
    arena::log::init();

    arena::map::MapDocument doc;
    try {
        if (cfg.map_path.empty()) {
            doc = arena::map::default_map_document();
        } else {
            std::vector<arena::map::LoadWarning> warnings;
            doc = arena::map::load_map_file(cfg.map_path, warnings);
            for (const auto &w : warnings)
                arena::log::warn("[map] {} entity#{}: {}", arena::map::to_string(w.kind), w.entity_index, w.message);
        }
    } catch (const arena::map::MapError &e) {
        arena::log::error("[map] {}: {}", arena::map::to_string(e.kind), e.what());
        arena::log::flush();
        return 1;
    }
    if (print_map) {
        std::cout << arena::map::emit_map_document(doc) << std::endl;
        arena::log::flush();
        return 0;
    }
    auto maps = std::make_shared<arena::map::MapStore>();
    if (!maps->install(doc)) {
        arena::log::flush();
        return 1;
    }

    auto match_cfg = arena::to_match_config(cfg);
    arena::log::info("arena server starting");
    if (cli_port_override) {
        cfg.listen_port = port_override;
        arena::log::info("CLI override: listen_port set to {}", cfg.listen_port);
    }
    if (duration_override_sec > 0)
        arena::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);
    arena::log::info("Tick rate: {} Hz, substeps {}", cfg.tick_rate, cfg.substeps);
    arena::log::info("Mode: {} map: {}", arena::game::to_string(match_cfg.mode),
        cfg.map_path.empty() ? std::string("<built-in grid>") : cfg.map_path);

    auto sessions = std::make_shared<arena::session::SessionManager>(
        arena::session::SessionLimits{cfg.max_input_delta, cfg.max_outbound_frames});
    auto runner = std::make_shared<arena::game::MatchRunner>(sessions, maps, match_cfg);
    auto running = std::make_shared<std::atomic<bool>>(true);

    auto scheduler = coro::default_executor::io_executor();
    scheduler->spawn(arena::net::run_listener(scheduler, sessions, cfg.listen_port, cfg.tick_rate, running));
    scheduler->spawn(arena::game::run_match_loop(scheduler, runner, cfg.tick_rate, running));
    scheduler->spawn(idle_monitor(scheduler, sessions, cfg.idle_timeout_seconds));

    auto run_start = std::chrono::steady_clock::now();
    auto last_metrics = run_start;
    while (!arena::g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        auto now = std::chrono::steady_clock::now();
        if (duration_override_sec > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - run_start).count();
            if (elapsed >= duration_override_sec) {
                arena::log::info("Duration reached ({}s >= {}s); initiating shutdown", elapsed, duration_override_sec);
                arena::g_shutdown.store(true);
            }
        }
        if (now - last_metrics >= std::chrono::seconds(60)) {
            last_metrics = now;
            arena::log::info("metrics {}", arena::metrics::runtime_json());
        }
    }
    arena::log::info("Signal received, shutting down...");
    running->store(false);
    // let the coroutines observe the flag (listener poll 250ms, match loop one tick)
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    arena::log::info("metrics {}", arena::metrics::runtime_json());
    arena::log::flush();
    return 0;
}
