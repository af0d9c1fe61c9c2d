#include <fuelhud/calc.hpp>
#include <algorithm>
#include <cmath>

namespace fuelhud {

double linear_interp(double x, double x1, double y1, double x2, double y2) {
  const double x_diff = x2 - x1;
  if (x_diff != 0.0) return y1 + (x - x1) * (y2 - y1) / x_diff;
  return y1;
}

double distance(const Vec3& a, const Vec3& b) {
  const double dx = b[0] - a[0];
  const double dy = b[1] - a[1];
  const double dz = b[2] - a[2];
  return std::sqrt(dx*dx + dy*dy + dz*dz);
}

double liter_to_gallon(double liter) {
  return liter * 0.26417205;
}

double frac(double x) {
  return x - std::floor(x);
}

double delta_telemetry(double position, double live, const DeltaCurve& curve,
                       bool condition, double offset) {
  if (curve.empty()) return 0.0;
  const std::size_t hi = binary_search_higher_index(curve, position, 0, curve.size() - 1,
                                                    kColDistance);
  // Needs a lower neighbour to interpolate against
  if (hi > 0 && condition) {
    const auto& a = curve[hi - 1];
    const auto& b = curve[hi];
    return live + offset - linear_interp(position, a.distance, a.fuel_used,
                                         b.distance, b.fuel_used);
  }
  return 0.0;
}

double lap_type_full_laps_remain(double laps_total, double laps_finished) {
  return laps_total - laps_finished;
}

double lap_type_laps_remain(double laps_full_remain, double lap_into) {
  return laps_full_remain - lap_into;
}

double time_type_full_laps_remain(double laptime_current, double laptime_last,
                                  double seconds_remain) {
  if (laptime_last == 0.0) return 0.0;
  // Seconds into the lap at the moment the race clock runs out
  const double seconds_into_lap = frac(laptime_current / laptime_last) * laptime_last;
  // Counted from the start line of the current lap
  return std::ceil((seconds_remain + seconds_into_lap) / laptime_last);
}

double time_type_laps_remain(double laps_full_remain, double lap_into,
                             double laps_remain, bool delay) {
  if (delay) return laps_remain;
  return std::max(laps_full_remain - lap_into, 0.0);
}

double total_fuel_needed(double laps_remain, double consumption, double fuel_in_tank) {
  return laps_remain * consumption - fuel_in_tank;
}

double end_lap_consumption(double consumption, double consumption_delta, bool condition) {
  if (condition) return consumption + consumption_delta;
  return consumption;
}

double end_stint_fuel(double fuel_in_tank, double consumption_into_lap, double consumption) {
  if (consumption == 0.0) return 0.0;
  const double fuel_at_lap_start = fuel_in_tank + consumption_into_lap;
  return frac(fuel_at_lap_start / consumption) * consumption;
}

double end_stint_laps(double fuel_in_tank, double consumption) {
  if (consumption == 0.0) return 0.0;
  return fuel_in_tank / consumption;
}

double end_stint_minutes(double laps_total, double laptime_last) {
  return laps_total * laptime_last / 60.0;
}

double end_lap_empty_capacity(double capacity_total, double fuel_in_tank, double consumption) {
  return capacity_total - fuel_in_tank + consumption;
}

double end_stint_pit_counts(double fuel_needed, double capacity_total) {
  if (capacity_total == 0.0) return 0.0;
  return fuel_needed / capacity_total;
}

double end_lap_pit_counts(double fuel_needed, double capacity_empty, double capacity_total) {
  // Fuel that fits without exceeding capacity at the end of this lap
  const double fuel_addable = std::min(fuel_needed, capacity_empty);
  // 1 when there is no empty space left this stint
  const double pits_before = capacity_empty != 0.0 ? fuel_addable / capacity_empty : 1.0;
  const double pits_after = capacity_total != 0.0
    ? (fuel_needed - fuel_addable) / capacity_total
    : 0.0;
  return pits_before + pits_after;
}

double one_less_pit_stop_consumption(double pit_counts_late, double capacity_total,
                                     double fuel_in_tank, double laps_remain) {
  if (laps_remain == 0.0) return 0.0;
  const double pit_counts = std::ceil(pit_counts_late) - 1.0;
  return (pit_counts * capacity_total + fuel_in_tank) / laps_remain;
}

} // namespace fuelhud
