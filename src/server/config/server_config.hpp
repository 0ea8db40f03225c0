// SPDX-License-Identifier: Apache-2.0
// server_config.hpp - server.yaml schema and its mapping onto MatchConfig
#pragma once
#include "server/game/match.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace arena {

// Unknown enumerated values in the config. yaml-cpp exceptions cover syntax and type errors.
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig
{
    uint16_t listen_port{40001};
    uint32_t tick_rate{60};
    int substeps{4};
    uint32_t idle_timeout_seconds{15};
    std::string log_level{"info"};
    bool log_json{false};
    std::string map_path; // empty = built-in grid
    game::ModeKind mode{game::ModeKind::LastManStanding};
    uint32_t min_players{2};
    uint32_t lobby_countdown_ticks{180};
    uint32_t post_end_grace_ticks{60};
    float grab_radius{0.05f};
    uint32_t fling_window_ticks{3};
    float lethal_fling_speed{6.f};
    float projectile_rest_speed{0.25f};
    float max_tether_speed{60.f};
    float control_hold_seconds{5.f};
    float time_limit_seconds{0.f};
    game::DrawPolicy draw_policy{game::DrawPolicy::DrawAmongSimultaneous};
    float max_input_delta{2.f};
    uint32_t max_outbound_frames{256};
};

// Accepts "last_man_standing"/"lms" and "control_point"/"cp". Throws ConfigError otherwise.
game::ModeKind parse_mode(const std::string &s);
// Accepts "draw" and "no_contest". Throws ConfigError otherwise.
game::DrawPolicy parse_draw_policy(const std::string &s);

ServerConfig parse_server_config(const YAML::Node &root);
ServerConfig load_server_config(const std::string &path);

game::MatchConfig to_match_config(const ServerConfig &cfg);

} // namespace arena
