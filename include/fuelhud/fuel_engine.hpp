#pragma once
#include <string>
#include <fuelhud/calc.hpp>
#include <fuelhud/config.hpp>
#include <fuelhud/fuel_curve.hpp>
#include <fuelhud/fuel_metrics.hpp>
#include <fuelhud/lap_recorder.hpp>
#include <fuelhud/telemetry.hpp>

namespace fuelhud {

// Per-tick fuel estimator for one driving session.
// Not thread-safe; owned by the runner thread.
class FuelEngine {
public:
  explicit FuelEngine(const EngineThresholds& t = {});

  // Idle -> active: load the combo's reference curve and clear live state.
  void reset(const std::string& combo, const FuelCurveStore& store);
  void reset(const std::string& combo, const CurveLoad& baseline);

  // One active iteration: consume the frame, publish metrics (and history) to board.
  const FuelMetrics& tick(const TelemetryFrame& frame, MetricsBoard& board);

  // Active -> idle: persist the reference curve if a new lap was committed.
  bool end_session(const FuelCurveStore& store);

  const FuelMetrics& metrics() const { return metrics_; }
  const DeltaCurve& reference_curve() const { return reference_; }
  const LapRecorder& recorder() const { return recorder_; }
  const std::string& combo() const { return combo_; }
  bool curve_dirty() const { return dirty_; }
  double laps_left() const { return laps_left_; }
  double used_last() const { return used_last_; }
  double laptime_last() const { return laptime_last_; }

private:
  void clear_live_state_();

  EngineThresholds th_;
  std::string combo_;
  LapRecorder recorder_;
  DeltaCurve reference_ = default_delta_curve();
  bool dirty_{false};

  // Baseline from the reference lap
  double used_last_{0.0};
  double laptime_last_{0.0};

  // Live lap state
  double amount_start_{0.0};
  double amount_last_{0.0};
  double amount_need_{0.0};
  double used_curr_{0.0};
  double used_last_raw_{0.0};
  double delta_fuel_{0.0};
  double laps_left_{0.0};
  double last_lap_stime_{-1.0};   // -1: no lap start seen yet
  double laptime_measured_{0.0};  // duration between the last two line crossings
  double pos_last_{0.0};
  double pos_estimate_{0.0};
  Vec3 gps_last_{0.0, 0.0, 0.0};
  bool pit_lap_{false};
  bool history_pending_{false};    // lap finished, entry not yet written

  FuelMetrics metrics_{};
};

} // namespace fuelhud
