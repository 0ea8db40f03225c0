// SPDX-License-Identifier: Apache-2.0
#include "server/config/server_config.hpp"

namespace arena {

game::ModeKind parse_mode(const std::string &s)
{
    if (s == "last_man_standing" || s == "lms")
        return game::ModeKind::LastManStanding;
    if (s == "control_point" || s == "cp")
        return game::ModeKind::ControlPoint;
    throw ConfigError("unknown mode '" + s + "' (expected last_man_standing or control_point)");
}

game::DrawPolicy parse_draw_policy(const std::string &s)
{
    if (s == "draw")
        return game::DrawPolicy::DrawAmongSimultaneous;
    if (s == "no_contest")
        return game::DrawPolicy::NoContest;
    throw ConfigError("unknown draw_policy '" + s + "' (expected draw or no_contest)");
}

ServerConfig parse_server_config(const YAML::Node &root)
{
    ServerConfig cfg;
    if (!root || root.IsNull())
        return cfg;
    if (!root.IsMap())
        throw ConfigError("config root must be a mapping");
    if (root["listen_port"])
        cfg.listen_port = root["listen_port"].as<uint16_t>();
    if (root["tick_rate"])
        cfg.tick_rate = root["tick_rate"].as<uint32_t>();
    if (root["substeps"])
        cfg.substeps = root["substeps"].as<int>();
    if (root["idle_timeout_seconds"])
        cfg.idle_timeout_seconds = root["idle_timeout_seconds"].as<uint32_t>();
    if (root["log_level"])
        cfg.log_level = root["log_level"].as<std::string>();
    if (root["log_json"])
        cfg.log_json = root["log_json"].as<bool>();
    if (root["map_path"])
        cfg.map_path = root["map_path"].as<std::string>();
    if (root["mode"])
        cfg.mode = parse_mode(root["mode"].as<std::string>());
    if (root["min_players"])
        cfg.min_players = root["min_players"].as<uint32_t>();
    if (root["lobby_countdown_ticks"])
        cfg.lobby_countdown_ticks = root["lobby_countdown_ticks"].as<uint32_t>();
    if (root["post_end_grace_ticks"])
        cfg.post_end_grace_ticks = root["post_end_grace_ticks"].as<uint32_t>();
    if (root["grab_radius"])
        cfg.grab_radius = root["grab_radius"].as<float>();
    if (root["fling_window_ticks"])
        cfg.fling_window_ticks = root["fling_window_ticks"].as<uint32_t>();
    if (root["lethal_fling_speed"])
        cfg.lethal_fling_speed = root["lethal_fling_speed"].as<float>();
    if (root["projectile_rest_speed"])
        cfg.projectile_rest_speed = root["projectile_rest_speed"].as<float>();
    if (root["max_tether_speed"])
        cfg.max_tether_speed = root["max_tether_speed"].as<float>();
    if (root["control_hold_seconds"])
        cfg.control_hold_seconds = root["control_hold_seconds"].as<float>();
    if (root["time_limit_seconds"])
        cfg.time_limit_seconds = root["time_limit_seconds"].as<float>();
    if (root["draw_policy"])
        cfg.draw_policy = parse_draw_policy(root["draw_policy"].as<std::string>());
    if (root["max_input_delta"])
        cfg.max_input_delta = root["max_input_delta"].as<float>();
    if (root["max_outbound_frames"])
        cfg.max_outbound_frames = root["max_outbound_frames"].as<uint32_t>();
    return cfg;
}

ServerConfig load_server_config(const std::string &path)
{
    return parse_server_config(YAML::LoadFile(path));
}

game::MatchConfig to_match_config(const ServerConfig &cfg)
{
    game::MatchConfig mc;
    mc.tick_rate = cfg.tick_rate;
    mc.substeps = cfg.substeps;
    mc.grab_radius = cfg.grab_radius;
    mc.fling_window_ticks = cfg.fling_window_ticks;
    mc.lethal_fling_speed = cfg.lethal_fling_speed;
    mc.projectile_rest_speed = cfg.projectile_rest_speed;
    mc.max_tether_speed = cfg.max_tether_speed;
    mc.mode = cfg.mode;
    mc.min_players = cfg.min_players;
    mc.lobby_countdown_ticks = cfg.lobby_countdown_ticks;
    mc.post_end_grace_ticks = cfg.post_end_grace_ticks;
    mc.control_hold_seconds = cfg.control_hold_seconds;
    mc.time_limit_seconds = cfg.time_limit_seconds;
    mc.draw_policy = cfg.draw_policy;
    return mc;
}

} // namespace arena
