#include <fuelhud/sim.hpp>
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace fuelhud {

// Lookahead spans at least one polyline vertex on the arcs.
static constexpr double kCornerLookahead_m = 15.0;
static constexpr double kMaxSubstep_s = 1.0 / 120.0;

SimServer::SimServer(const SimConfig& cfg)
  : cfg_(cfg), path_(TrackPath::Stadium(cfg.straight_m, cfg.radius_m, 12)) {
  reset();
}

void SimServer::reset() {
  t_ = 0.0;
  s_ = 0.0;
  fuel_ = std::clamp(cfg_.start_fuel_l, 0.0, cfg_.tank_capacity_l);
  lap_start_ = 0.0;
  last_laptime_ = 0.0;
  laps_ = 0;
  pit_requested_ = false;
  in_pits_ = false;
  pit_timer_ = 0.0;
  finished_ = false;
}

bool SimServer::in_corner_(double s) const {
  return path_.heading_change(s, kCornerLookahead_m) > 1e-3;
}

double SimServer::speed_at(double s) const {
  return in_corner_(s) ? cfg_.corner_speed_mps : cfg_.straight_speed_mps;
}

double SimServer::burn_per_m_at(double s) const {
  return (in_corner_(s) ? cfg_.burn_corner_l_per_km : cfg_.burn_straight_l_per_km) / 1000.0;
}

void SimServer::step(double dt_sec) {
  if (finished_ || dt_sec <= 0.0 || path_.empty()) return;
  t_ += dt_sec;

  if (in_pits_) {
    fuel_ = std::min(cfg_.tank_capacity_l, fuel_ + cfg_.refuel_rate_lps * dt_sec);
    pit_timer_ -= dt_sec;
    if (pit_timer_ <= 0.0 && fuel_ >= cfg_.tank_capacity_l) in_pits_ = false;
    return;
  }

  const double v = speed_at(s_);
  const double ds = v * dt_sec;
  fuel_ -= burn_per_m_at(s_) * ds;
  if (fuel_ <= 0.0) {
    fuel_ = 0.0;
    finished_ = true;
    spdlog::info("sim: out of fuel on lap {}", laps_ + 1);
    return;
  }

  s_ += ds;
  if (s_ >= path_.length()) {
    s_ -= path_.length();
    cross_line_(v);
  }
}

void SimServer::cross_line_(double speed) {
  const double t_cross = t_ - (speed > 0.0 ? s_ / speed : 0.0);
  last_laptime_ = t_cross - lap_start_;
  lap_start_ = t_cross;
  ++laps_;

  if (lap_type_race() ? laps_ >= cfg_.max_laps : t_cross >= cfg_.session_seconds) {
    finished_ = true;
    spdlog::info("sim: chequered flag after {} laps", laps_);
    return;
  }

  if (pit_requested_) {
    pit_requested_ = false;
    in_pits_ = true;
    pit_timer_ = cfg_.pit_stationary_s;
    s_ = 0.0;
  }
}

TelemetryFrame SimServer::frame() const {
  TelemetryFrame f;
  f.lap_start_time = lap_start_;
  f.current_laptime = t_ - lap_start_;
  f.last_laptime = last_laptime_;
  f.time_remaining = lap_type_race() ? 0.0 : std::max(cfg_.session_seconds - t_, 0.0);
  f.fuel = fuel_;
  f.tank_capacity = cfg_.tank_capacity_l;
  f.in_garage = false;
  f.in_pits = in_pits_;
  double x, y, heading;
  sample_pose(x, y, heading);
  f.position = Vec3{x, y, 0.0};
  f.lap_distance = s_;
  f.lap_progress = path_.length() > 0.0 ? s_ / path_.length() : 0.0;
  f.lap_number = laps_;
  f.lap_max = std::max(cfg_.max_laps, 0);
  f.lap_type_race = lap_type_race();
  return f;
}

std::string SimServer::combo_id() const {
  return make_combo_id(cfg_.track_name, cfg_.vehicle_class);
}

// ---- SimTelemetrySource ----

SimTelemetrySource::SimTelemetrySource(const SimConfig& cfg) : sim_(cfg) {}

void SimTelemetrySource::step_locked_(double sim_dt) {
  while (sim_dt > 0.0) {
    const double dt = std::min(sim_dt, kMaxSubstep_s);
    sim_.step(dt);
    sim_dt -= dt;
  }
}

void SimTelemetrySource::catch_up_() {
  const auto now = std::chrono::steady_clock::now();
  if (!clock_started_) {
    clock_started_ = true;
    last_wall_ = now;
    return;
  }
  const double wall_dt = std::chrono::duration<double>(now - last_wall_).count();
  last_wall_ = now;
  const double warp = time_scale.load(std::memory_order_relaxed);
  step_locked_(wall_dt * (warp < 0.0 ? 0.0 : warp));
}

bool SimTelemetrySource::driving() {
  std::lock_guard<std::mutex> lock(mu_);
  catch_up_();
  return sim_.driving();
}

std::string SimTelemetrySource::combo_id() {
  std::lock_guard<std::mutex> lock(mu_);
  return sim_.combo_id();
}

TelemetryFrame SimTelemetrySource::read() {
  std::lock_guard<std::mutex> lock(mu_);
  catch_up_();
  return sim_.frame();
}

void SimTelemetrySource::request_pit() {
  std::lock_guard<std::mutex> lock(mu_);
  sim_.request_pit();
}

void SimTelemetrySource::restart() {
  std::lock_guard<std::mutex> lock(mu_);
  sim_.reset();
  clock_started_ = false;
}

void SimTelemetrySource::advance(double sim_dt) {
  std::lock_guard<std::mutex> lock(mu_);
  step_locked_(sim_dt);
}

SimServer SimTelemetrySource::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return sim_;
}

} // namespace fuelhud
