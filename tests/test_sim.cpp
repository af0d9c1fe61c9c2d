#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <fuelhud/sim.hpp>

using Catch::Approx;
using namespace fuelhud;

namespace {

void run_laps(SimServer& sim, int laps, double dt = 0.02) {
  while (sim.driving() && sim.laps() < laps) sim.step(dt);
}

} // namespace

TEST_CASE("Stadium track length and corner profile") {
  SimServer sim;
  const double L = sim.track().length();
  // Two straights plus a full circle of radius 80 (polyline slightly shorter)
  REQUIRE(L == Approx(250.0 * 2 + 2 * kPI * 80.0).margin(3.0));

  // Start lies on the right arc, the top straight is past half the first arc
  REQUIRE(sim.speed_at(10.0) == Approx(45.0));
  REQUIRE(sim.speed_at(L * 0.5 - 125.0) == Approx(70.0));
  REQUIRE(sim.burn_per_m_at(L * 0.5 - 125.0) > sim.burn_per_m_at(10.0));
}

TEST_CASE("SimServer advances, burns fuel and counts laps") {
  SimServer sim;
  const auto f0 = sim.frame();
  REQUIRE(f0.fuel == Approx(60.0));
  REQUIRE(f0.lap_number == 0);
  REQUIRE(f0.lap_type_race);

  run_laps(sim, 1);
  const auto f1 = sim.frame();
  REQUIRE(f1.lap_number == 1);
  REQUIRE(f1.fuel < 60.0);
  REQUIRE(f1.last_laptime > 0.0);
  REQUIRE(f1.lap_start_time == Approx(f1.last_laptime));
  REQUIRE(f1.current_laptime < 0.05);
  REQUIRE(f1.lap_progress >= 0.0);
  REQUIRE(f1.lap_progress < 0.01);

  // Identical laps
  const double used1 = 60.0 - f1.fuel;
  run_laps(sim, 2);
  REQUIRE(f1.fuel - sim.fuel() == Approx(used1).margin(0.01));
}

TEST_CASE("Time warp scales advancement linearly") {
  SimServer a, b;
  a.step(0.5);
  b.step(1.0);
  REQUIRE(b.lap_distance() == Approx(2.0 * a.lap_distance()));

  SimServer paused;
  paused.step(0.0);
  REQUIRE(paused.lap_distance() == 0.0);
  REQUIRE(paused.session_time() == 0.0);
}

TEST_CASE("Lap-type race finishes at the lap target") {
  SimConfig cfg;
  cfg.max_laps = 2;
  SimServer sim(cfg);
  run_laps(sim, 5);
  REQUIRE_FALSE(sim.driving());
  REQUIRE(sim.laps() == 2);

  // Finished sessions no longer advance
  const double t = sim.session_time();
  sim.step(1.0);
  REQUIRE(sim.session_time() == t);
}

TEST_CASE("Time-type race finishes at the first line crossing after the clock") {
  SimConfig cfg;
  cfg.max_laps = 0;
  cfg.session_seconds = 30.0;
  SimServer sim(cfg);
  REQUIRE_FALSE(sim.frame().lap_type_race);
  REQUIRE(sim.frame().time_remaining == Approx(30.0));

  while (sim.driving()) sim.step(0.02);
  REQUIRE(sim.laps() == 2);
  REQUIRE(sim.frame().time_remaining == 0.0);
}

TEST_CASE("Pit request stops the car and refuels to capacity") {
  SimConfig cfg;
  cfg.start_fuel_l = 30.0;
  SimServer sim(cfg);
  sim.request_pit();
  REQUIRE(sim.pit_requested());

  run_laps(sim, 1);
  REQUIRE(sim.in_pits());
  REQUIRE(sim.frame().in_pits);
  REQUIRE(sim.lap_distance() == 0.0);

  const double fuel_in = sim.fuel();
  sim.step(1.0);
  REQUIRE(sim.fuel() == Approx(fuel_in + 10.0));
  REQUIRE(sim.lap_distance() == 0.0);

  while (sim.in_pits()) sim.step(0.02);
  REQUIRE(sim.fuel() == Approx(100.0));
  REQUIRE_FALSE(sim.pit_requested());
  REQUIRE(sim.session_time() > sim.frame().lap_start_time + cfg.pit_stationary_s - 0.05);
}

TEST_CASE("Running dry ends the session") {
  SimConfig cfg;
  cfg.start_fuel_l = 1.0;
  SimServer sim(cfg);
  run_laps(sim, 1);
  REQUIRE_FALSE(sim.driving());
  REQUIRE(sim.fuel() == 0.0);
  REQUIRE(sim.laps() == 0);
}

TEST_CASE("SimTelemetrySource steps on demand and restarts") {
  SimTelemetrySource src;
  REQUIRE(src.combo_id() == "Stadium - GT3");
  src.time_scale.store(0.0);
  REQUIRE(src.driving());

  src.advance(2.0);
  const auto f = src.read();  // paused: no wall-clock advancement
  REQUIRE(f.current_laptime == Approx(2.0));

  src.request_pit();
  REQUIRE(src.snapshot().pit_requested());

  src.restart();
  REQUIRE(src.snapshot().session_time() == 0.0);
  REQUIRE_FALSE(src.snapshot().pit_requested());
}
