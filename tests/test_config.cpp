#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <fuelhud/config.hpp>
#include <fuelhud/sim.hpp>
#include <spdlog/spdlog.h>

using Catch::Approx;
using namespace fuelhud;

static const char* kFullYaml = R"(
fuel:
  update_interval_ms: 50
  idle_update_interval_ms: 1000
  curve_directory: "data/fuel"
  curve_extension: ".deltafuel"
  history_size: 20
thresholds:
  validate_min_s: 0.1
  validate_max_s: 4.0
  terminal_offset_m: 5.0
  lap_desync_s: 0.3
sim:
  track_name: "Ring"
  vehicle_class: "LMP2"
  max_laps: 0
  session_seconds: 1800
  start_fuel_l: 75
log_level: "debug"
)";

TEST_CASE("fuel_config_from_yaml reads every section") {
  const auto cfg = fuel_config_from_yaml(kFullYaml);
  REQUIRE(cfg.update_interval_ms == 50);
  REQUIRE(cfg.idle_update_interval_ms == 1000);
  REQUIRE(cfg.curve_directory == "data/fuel");
  REQUIRE(cfg.curve_extension == ".deltafuel");
  REQUIRE(cfg.history_size == 20);
  REQUIRE(cfg.log_level == "debug");
  REQUIRE(cfg.thresholds.validate_min_s == Approx(0.1));
  REQUIRE(cfg.thresholds.validate_max_s == Approx(4.0));
  REQUIRE(cfg.thresholds.terminal_offset_m == Approx(5.0));
  REQUIRE(cfg.thresholds.lap_desync_s == Approx(0.3));
  // Untouched keys keep defaults
  REQUIRE(cfg.thresholds.position_reset_m == Approx(300.0));
  REQUIRE(cfg.thresholds.history_delay_s == Approx(2.0));
}

TEST_CASE("Missing keys and bad documents fall back to defaults") {
  const FuelConfig def;

  SECTION("empty document") {
    const auto cfg = fuel_config_from_yaml("");
    REQUIRE(cfg.update_interval_ms == def.update_interval_ms);
    REQUIRE(cfg.curve_directory == def.curve_directory);
  }
  SECTION("unparsable document") {
    const auto cfg = fuel_config_from_yaml("fuel: [unterminated");
    REQUIRE(cfg.idle_update_interval_ms == def.idle_update_interval_ms);
  }
  SECTION("missing file") {
    const auto cfg = load_fuel_config("/nonexistent/fuelhud.yaml");
    REQUIRE(cfg.history_size == def.history_size);
  }
  SECTION("non-positive intervals are clamped") {
    const auto cfg = fuel_config_from_yaml("fuel:\n  update_interval_ms: 0\n  history_size: 0\n");
    REQUIRE(cfg.update_interval_ms == 1);
    REQUIRE(cfg.history_size == 1);
  }
}

TEST_CASE("sim_config_from_yaml reads the sim section") {
  const auto sim = sim_config_from_yaml(kFullYaml);
  REQUIRE(sim.track_name == "Ring");
  REQUIRE(sim.vehicle_class == "LMP2");
  REQUIRE(sim.max_laps == 0);
  REQUIRE(sim.session_seconds == Approx(1800.0));
  REQUIRE(sim.start_fuel_l == Approx(75.0));
  REQUIRE(sim.tank_capacity_l == Approx(SimConfig{}.tank_capacity_l));

  REQUIRE(sim_config_from_yaml("fuel: {}").track_name == SimConfig{}.track_name);
}

TEST_CASE("load_fuel_config reads a file") {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    ("fuelhud_cfg_" + std::to_string(stamp) + ".yaml");
  {
    std::ofstream out(path);
    out << kFullYaml;
  }
  const auto cfg = load_fuel_config(path.string());
  const auto sim = load_sim_config(path.string());
  std::filesystem::remove(path);

  REQUIRE(cfg.history_size == 20);
  REQUIRE(sim.vehicle_class == "LMP2");
}

TEST_CASE("apply_log_level keeps logging on for unknown names") {
  const auto before = spdlog::get_level();
  FuelConfig cfg;

  cfg.log_level = "debug";
  apply_log_level(cfg);
  REQUIRE(spdlog::get_level() == spdlog::level::debug);

  cfg.log_level = "inf";
  apply_log_level(cfg);
  REQUIRE(spdlog::get_level() == spdlog::level::info);

  cfg.log_level = "off";
  apply_log_level(cfg);
  REQUIRE(spdlog::get_level() == spdlog::level::off);

  spdlog::set_level(before);
}
