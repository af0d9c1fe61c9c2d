#include <fuelhud/fuel_engine.hpp>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace fuelhud {

FuelEngine::FuelEngine(const EngineThresholds& t) : th_(t), recorder_(t) {}

void FuelEngine::reset(const std::string& combo, const FuelCurveStore& store) {
  reset(combo, store.load(combo));
}

void FuelEngine::reset(const std::string& combo, const CurveLoad& baseline) {
  combo_ = combo;
  reference_ = baseline.curve.empty() ? default_delta_curve() : baseline.curve;
  used_last_ = baseline.used_last;
  laptime_last_ = baseline.laptime_last;
  dirty_ = false;
  clear_live_state_();
  used_last_raw_ = used_last_;
}

void FuelEngine::clear_live_state_() {
  recorder_.reset();
  amount_start_ = 0.0;
  amount_last_ = 0.0;
  amount_need_ = 0.0;
  used_curr_ = 0.0;
  used_last_raw_ = 0.0;
  delta_fuel_ = 0.0;
  laps_left_ = 0.0;
  last_lap_stime_ = -1.0;
  laptime_measured_ = 0.0;
  history_pending_ = false;
  pos_last_ = 0.0;
  pos_estimate_ = 0.0;
  gps_last_ = Vec3{0.0, 0.0, 0.0};
  pit_lap_ = false;
  metrics_ = FuelMetrics{};
}

const FuelMetrics& FuelEngine::tick(const TelemetryFrame& frame, MetricsBoard& board) {
  const double lap_stime = frame.lap_start_time;
  const double laptime_curr = std::max(frame.current_laptime, 0.0);
  const double laptime_valid = frame.last_laptime;
  const double amount_curr = frame.fuel;
  const double capacity = std::max(frame.tank_capacity, 1.0);
  const int lap_number = frame.lap_number;
  double pos_curr = frame.lap_distance;
  pit_lap_ = pit_lap_ || frame.in_pits;

  // Fuel reading only drops while driving; a rise is a refuel
  if (amount_last_ < amount_curr) {
    amount_last_ = amount_curr;
    amount_start_ = amount_curr;
  } else if (amount_last_ > amount_curr) {
    used_curr_ += amount_last_ - amount_curr;
    amount_last_ = amount_curr;
  }

  // Line crossing
  if (last_lap_stime_ != -1.0 && lap_stime > last_lap_stime_) {
    const double lap_duration = lap_stime - last_lap_stime_;
    if (recorder_.on_lap_start(pos_last_, used_curr_, lap_duration, pit_lap_, laptime_curr)) {
      spdlog::debug("fuel: lap staged, used={:.3f} time={:.3f}", used_curr_, lap_duration);
    }
    laptime_measured_ = lap_duration;
    history_pending_ = true;
    pos_last_ = pos_curr;
    used_last_raw_ = used_curr_;
    used_curr_ = 0.0;
    pit_lap_ = false;
  }
  last_lap_stime_ = lap_stime;

  // Stale distance right after the line
  if (laptime_curr > 0.0 && laptime_curr < th_.position_reset_window_s &&
      pos_curr > th_.position_reset_m) {
    pos_last_ = pos_curr = 0.0;
  }

  if (pos_curr >= 0.0 && pos_curr != pos_last_) {
    if (pos_curr > pos_last_) recorder_.record(pos_curr, used_curr_);
    pos_estimate_ = pos_last_ = pos_curr;
  }

  switch (recorder_.validate(laptime_curr, laptime_valid)) {
    case Validation::Committed:
      used_last_ = used_last_raw_;
      laptime_last_ = laptime_valid;
      reference_ = recorder_.take_staged();
      dirty_ = true;
      spdlog::debug("fuel: reference lap committed ({} samples)", reference_.size());
      break;
    case Validation::Abandoned:
      spdlog::debug("fuel: staged lap abandoned, no laptime confirmation");
      break;
    case Validation::None:
      break;
  }

  // Position estimate follows world movement between lap distance updates
  if (gps_last_ != frame.position) {
    pos_estimate_ += distance(gps_last_, frame.position);
    gps_last_ = frame.position;
    delta_fuel_ = delta_telemetry(pos_estimate_, used_curr_, reference_,
                                  laptime_curr > th_.delta_gate_s && !frame.in_garage);
  }

  // First lap and pit in/out laps keep the plain baseline
  const double used_est = end_lap_consumption(used_last_, delta_fuel_,
                                               !pit_lap_ && lap_number > 0);

  if (frame.lap_type_race) {
    const double full_laps_left = lap_type_full_laps_remain(frame.lap_max, lap_number);
    laps_left_ = lap_type_laps_remain(full_laps_left, frame.lap_progress);
    amount_need_ = total_fuel_needed(laps_left_, used_est, amount_curr);
  } else if (laptime_last_ > 0.0) {
    const double full_laps_left = time_type_full_laps_remain(
      laptime_curr, laptime_last_, frame.time_remaining);
    laps_left_ = time_type_laps_remain(full_laps_left, frame.lap_progress, laps_left_,
                                       laptime_curr < th_.lap_desync_s);
    amount_need_ = total_fuel_needed(laps_left_, used_est, amount_curr);
  }

  const double amount_left = end_stint_fuel(amount_curr, used_curr_, used_est);
  const double est_runlaps = end_stint_laps(amount_curr, used_est);
  const double est_empty = end_lap_empty_capacity(
    capacity, amount_curr + used_curr_, used_last_ + delta_fuel_);
  const double est_pits_late = end_stint_pit_counts(amount_need_, capacity - amount_left);

  metrics_.capacity = capacity;
  metrics_.amount_start = amount_start_;
  metrics_.amount_current = amount_curr;
  metrics_.amount_needed = amount_need_;
  metrics_.amount_before_pitstop = amount_left;
  metrics_.last_lap_consumption = used_last_raw_;
  metrics_.estimated_consumption = used_last_ + delta_fuel_;
  metrics_.delta_consumption = delta_fuel_;
  metrics_.estimated_laps = est_runlaps;
  metrics_.estimated_minutes = end_stint_minutes(est_runlaps, laptime_last_);
  metrics_.estimated_empty_capacity = est_empty;
  metrics_.estimated_pits_end = est_pits_late;
  metrics_.estimated_pits_early = end_lap_pit_counts(amount_need_, est_empty, capacity - amount_left);
  metrics_.one_less_pit_consumption = one_less_pit_stop_consumption(
    est_pits_late, capacity, amount_curr, laps_left_);
  board.publish(metrics_);

  // One entry per lap, shortly after the line
  if (history_pending_ && laptime_curr > th_.history_delay_s) {
    board.push_history(ConsumptionRecord{
      lap_number - 1,
      laptime_measured_,
      used_last_raw_,
      amount_curr,
      capacity,
      laptime_valid > 0.0,
    });
    history_pending_ = false;
  }
  return metrics_;
}

bool FuelEngine::end_session(const FuelCurveStore& store) {
  if (!dirty_) return false;
  dirty_ = false;
  return store.save(combo_, reference_);
}

} // namespace fuelhud
