#pragma once
#include <cstddef>
#include <string>

namespace fuelhud {

// Guard constants tuned against simulator telemetry quirks.
struct EngineThresholds {
  double validate_min_s = 0.2;           // staged lap confirmed after this laptime
  double validate_max_s = 3.0;           // ... and no later than this
  double position_reset_m = 300.0;       // distance implausible right after the line
  double position_reset_window_s = 1.0;
  double record_arm_s = 1.0;             // recording armed only if the lap began this recently
  double delta_gate_s = 0.3;             // no delta right after the line
  double terminal_offset_m = 10.0;       // terminal sample lies past the last position
  double history_delay_s = 2.0;          // history entry written this long after the line
  double lap_desync_s = 0.2;             // time-type laps-left held below this laptime
};

struct FuelConfig {
  int update_interval_ms = 20;
  int idle_update_interval_ms = 400;
  std::string curve_directory = "fuel";
  std::string curve_extension = ".fuel";
  std::size_t history_size = 100;
  std::string log_level = "info";
  EngineThresholds thresholds{};
};

// Missing keys keep their defaults. Parse errors are logged and yield defaults.
FuelConfig fuel_config_from_yaml(const std::string& text);
FuelConfig load_fuel_config(const std::string& path);

struct SimConfig;

// Reads the optional "sim" section. Same fallback rules as the fuel config.
SimConfig sim_config_from_yaml(const std::string& text);
SimConfig load_sim_config(const std::string& path);

// Applies FuelConfig::log_level to the default spdlog logger.
// An unknown name logs a warning and selects info.
void apply_log_level(const FuelConfig& cfg);

} // namespace fuelhud
