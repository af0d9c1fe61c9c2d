#include <fuelhud/lap_recorder.hpp>
#include <utility>

namespace fuelhud {

static DeltaCurve sentinel_curve() {
  return DeltaCurve{FuelSample{}};
}

void LapRecorder::reset() {
  phase_ = LapPhase::Idle;
  resume_ = LapPhase::Idle;
  current_ = sentinel_curve();
  staged_ = sentinel_curve();
}

bool LapRecorder::on_lap_start(double last_position, double used, double lap_duration,
                               bool pit_lap, double laptime_now) {
  bool staged = false;
  if (current_.size() > 1 && !pit_lap) {
    current_.push_back(FuelSample{round6(last_position + th_.terminal_offset_m),
                                  round6(used),
                                  round6(lap_duration)});
    staged_ = std::move(current_);
    staged = true;
  }
  current_ = sentinel_curve();

  // Armed only when the edge is seen right at the line
  const LapPhase next = laptime_now < th_.record_arm_s ? LapPhase::Recording : LapPhase::Idle;
  if (staged || phase_ == LapPhase::PendingValidation) {
    phase_ = LapPhase::PendingValidation;
    resume_ = next;
  } else {
    phase_ = next;
  }
  return staged;
}

void LapRecorder::record(double distance, double used) {
  if (!recording()) return;
  current_.push_back(FuelSample{round6(distance), round6(used), 0.0});
}

Validation LapRecorder::validate(double laptime_now, double last_laptime_reported) {
  if (phase_ != LapPhase::PendingValidation) return Validation::None;

  if (laptime_now > th_.validate_min_s && laptime_now <= th_.validate_max_s) {
    if (last_laptime_reported > 0.0) {
      phase_ = resume_;
      return Validation::Committed;
    }
  } else if (laptime_now > th_.validate_max_s) {
    staged_ = sentinel_curve();
    phase_ = resume_;
    return Validation::Abandoned;
  }
  return Validation::None;
}

DeltaCurve LapRecorder::take_staged() {
  DeltaCurve out = std::move(staged_);
  staged_ = sentinel_curve();
  return out;
}

} // namespace fuelhud
