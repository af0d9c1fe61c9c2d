#pragma once
#include <fuelhud/config.hpp>
#include <fuelhud/fuel_sample.hpp>

namespace fuelhud {

enum class LapPhase {
  Idle,               // not collecting samples for the current lap
  Recording,          // collecting samples for the current lap
  PendingValidation   // a finished lap is staged until the simulator confirms its laptime
};

enum class Validation { None, Committed, Abandoned };

// Builds the distance-indexed fuel curve of each lap and stages finished laps
// until the simulator's last-laptime field confirms them.
class LapRecorder {
public:
  explicit LapRecorder(const EngineThresholds& t = {}) : th_(t) { reset(); }

  void reset();

  // Line crossing. Stages the lap just finished when it holds samples and was
  // not a pit in/out lap. Returns true if a lap was staged.
  bool on_lap_start(double last_position, double used, double lap_duration,
                    bool pit_lap, double laptime_now);

  // Appends (distance, used) while recording is armed.
  void record(double distance, double used);

  // Runs the validation window for a staged lap.
  Validation validate(double laptime_now, double last_laptime_reported);

  // Moves the staged curve out (valid after Validation::Committed).
  DeltaCurve take_staged();

  LapPhase phase() const { return phase_; }
  bool recording() const {
    return phase_ == LapPhase::Recording ||
           (phase_ == LapPhase::PendingValidation && resume_ == LapPhase::Recording);
  }
  const DeltaCurve& current() const { return current_; }
  const DeltaCurve& staged() const { return staged_; }

private:
  EngineThresholds th_;
  LapPhase phase_{LapPhase::Idle};
  LapPhase resume_{LapPhase::Idle};  // phase after validation resolves
  DeltaCurve current_;
  DeltaCurve staged_;
};

} // namespace fuelhud
