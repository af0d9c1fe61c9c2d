#pragma once
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <fuelhud/telemetry.hpp>
#include <fuelhud/track_geom.hpp>

namespace fuelhud {

struct SimConfig {
  std::string track_name = "Stadium";
  std::string vehicle_class = "GT3";

  // Track shape (centerline, meters)
  double straight_m = 250.0;
  double radius_m = 80.0;

  double straight_speed_mps = 70.0;
  double corner_speed_mps = 45.0;

  // Fuel (liters)
  double tank_capacity_l = 100.0;
  double start_fuel_l = 60.0;
  double burn_straight_l_per_km = 3.0;
  double burn_corner_l_per_km = 2.0;

  // Race format: max_laps > 0 is a lap-type race, otherwise session_seconds applies
  int max_laps = 10;
  double session_seconds = 0.0;

  // Pit stop
  double pit_stationary_s = 8.0;
  double refuel_rate_lps = 10.0;
};

// Single-car fixed-step simulator producing player telemetry.
class SimServer {
public:
  explicit SimServer(const SimConfig& cfg = {});

  void reset();
  void step(double dt_sec);

  // Car stops at the next line crossing, refuels, then rejoins.
  void request_pit() { if (!finished_) pit_requested_ = true; }

  // False once the race target is reached or the tank ran dry.
  bool driving() const { return !finished_; }
  TelemetryFrame frame() const;
  std::string combo_id() const;

  const SimConfig& config() const { return cfg_; }
  const TrackPath& track() const { return path_; }
  double session_time() const { return t_; }
  double lap_distance() const { return s_; }
  double fuel() const { return fuel_; }
  int laps() const { return laps_; }
  bool pit_requested() const { return pit_requested_; }
  bool in_pits() const { return in_pits_; }
  bool lap_type_race() const { return cfg_.max_laps > 0; }
  void sample_pose(double& x, double& y, double& heading_rad) const {
    path_.sample_pose(s_, x, y, heading_rad);
  }

  double speed_at(double s) const;
  double burn_per_m_at(double s) const;

private:
  bool in_corner_(double s) const;
  void cross_line_(double speed);

  SimConfig cfg_;
  TrackPath path_;

  double t_{0.0};
  double s_{0.0};
  double fuel_{0.0};
  double lap_start_{0.0};
  double last_laptime_{0.0};
  int laps_{0};
  bool pit_requested_{false};
  bool in_pits_{false};
  double pit_timer_{0.0};
  bool finished_{false};
};

// Thread-safe TelemetrySource over a SimServer advanced by scaled wall-clock time.
class SimTelemetrySource : public TelemetrySource {
public:
  explicit SimTelemetrySource(const SimConfig& cfg = {});

  bool driving() override;
  std::string combo_id() override;
  TelemetryFrame read() override;

  void request_pit();
  void restart();
  // Steps the simulation by sim_dt seconds regardless of wall time.
  void advance(double sim_dt);
  SimServer snapshot() const;

  std::atomic<double> time_scale{1.0}; // 0.0 = paused

private:
  void catch_up_();
  void step_locked_(double sim_dt);

  mutable std::mutex mu_;
  SimServer sim_;
  std::chrono::steady_clock::time_point last_wall_{};
  bool clock_started_{false};
};

} // namespace fuelhud
