#include <fuelhud/config.hpp>
#include <fuelhud/sim.hpp>
#include <algorithm>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace fuelhud {

static void read_thresholds(const YAML::Node& n, EngineThresholds& t) {
  t.validate_min_s          = n["validate_min_s"].as<double>(t.validate_min_s);
  t.validate_max_s          = n["validate_max_s"].as<double>(t.validate_max_s);
  t.position_reset_m        = n["position_reset_m"].as<double>(t.position_reset_m);
  t.position_reset_window_s = n["position_reset_window_s"].as<double>(t.position_reset_window_s);
  t.record_arm_s            = n["record_arm_s"].as<double>(t.record_arm_s);
  t.delta_gate_s            = n["delta_gate_s"].as<double>(t.delta_gate_s);
  t.terminal_offset_m       = n["terminal_offset_m"].as<double>(t.terminal_offset_m);
  t.history_delay_s         = n["history_delay_s"].as<double>(t.history_delay_s);
  t.lap_desync_s            = n["lap_desync_s"].as<double>(t.lap_desync_s);
}

static FuelConfig from_node(const YAML::Node& root) {
  FuelConfig cfg;
  if (auto fuel = root["fuel"]) {
    cfg.update_interval_ms      = fuel["update_interval_ms"].as<int>(cfg.update_interval_ms);
    cfg.idle_update_interval_ms = fuel["idle_update_interval_ms"].as<int>(cfg.idle_update_interval_ms);
    cfg.curve_directory         = fuel["curve_directory"].as<std::string>(cfg.curve_directory);
    cfg.curve_extension         = fuel["curve_extension"].as<std::string>(cfg.curve_extension);
    cfg.history_size            = fuel["history_size"].as<std::size_t>(cfg.history_size);
  }
  if (auto th = root["thresholds"]) read_thresholds(th, cfg.thresholds);
  if (auto level = root["log_level"]) cfg.log_level = level.as<std::string>(cfg.log_level);

  // Intervals below 1 ms would spin the polling thread
  cfg.update_interval_ms      = std::max(cfg.update_interval_ms, 1);
  cfg.idle_update_interval_ms = std::max(cfg.idle_update_interval_ms, 1);
  cfg.history_size            = std::max<std::size_t>(cfg.history_size, 1);
  return cfg;
}

FuelConfig fuel_config_from_yaml(const std::string& text) {
  try {
    return from_node(YAML::Load(text));
  } catch (const std::exception& e) {
    spdlog::warn("fuel config: parse error, using defaults: {}", e.what());
    return FuelConfig{};
  }
}

FuelConfig load_fuel_config(const std::string& path) {
  try {
    return from_node(YAML::LoadFile(path));
  } catch (const std::exception& e) {
    spdlog::warn("fuel config: cannot load '{}', using defaults: {}", path, e.what());
    return FuelConfig{};
  }
}

static SimConfig sim_from_node(const YAML::Node& root) {
  SimConfig cfg;
  auto sim = root["sim"];
  if (!sim) return cfg;
  cfg.track_name             = sim["track_name"].as<std::string>(cfg.track_name);
  cfg.vehicle_class          = sim["vehicle_class"].as<std::string>(cfg.vehicle_class);
  cfg.straight_m             = sim["straight_m"].as<double>(cfg.straight_m);
  cfg.radius_m               = sim["radius_m"].as<double>(cfg.radius_m);
  cfg.straight_speed_mps     = sim["straight_speed_mps"].as<double>(cfg.straight_speed_mps);
  cfg.corner_speed_mps       = sim["corner_speed_mps"].as<double>(cfg.corner_speed_mps);
  cfg.tank_capacity_l        = sim["tank_capacity_l"].as<double>(cfg.tank_capacity_l);
  cfg.start_fuel_l           = sim["start_fuel_l"].as<double>(cfg.start_fuel_l);
  cfg.burn_straight_l_per_km = sim["burn_straight_l_per_km"].as<double>(cfg.burn_straight_l_per_km);
  cfg.burn_corner_l_per_km   = sim["burn_corner_l_per_km"].as<double>(cfg.burn_corner_l_per_km);
  cfg.max_laps               = sim["max_laps"].as<int>(cfg.max_laps);
  cfg.session_seconds        = sim["session_seconds"].as<double>(cfg.session_seconds);
  cfg.pit_stationary_s       = sim["pit_stationary_s"].as<double>(cfg.pit_stationary_s);
  cfg.refuel_rate_lps        = sim["refuel_rate_lps"].as<double>(cfg.refuel_rate_lps);
  return cfg;
}

SimConfig sim_config_from_yaml(const std::string& text) {
  try {
    return sim_from_node(YAML::Load(text));
  } catch (const std::exception& e) {
    spdlog::warn("sim config: parse error, using defaults: {}", e.what());
    return SimConfig{};
  }
}

SimConfig load_sim_config(const std::string& path) {
  try {
    return sim_from_node(YAML::LoadFile(path));
  } catch (const std::exception& e) {
    spdlog::warn("sim config: cannot load '{}', using defaults: {}", path, e.what());
    return SimConfig{};
  }
}

void apply_log_level(const FuelConfig& cfg) {
  const auto level = spdlog::level::from_str(cfg.log_level);
  // from_str maps unknown names to off
  if (level == spdlog::level::off && cfg.log_level != "off") {
    spdlog::set_level(spdlog::level::info);
    spdlog::warn("config: unknown log_level '{}', using info", cfg.log_level);
    return;
  }
  spdlog::set_level(level);
}

} // namespace fuelhud
