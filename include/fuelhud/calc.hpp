#pragma once
#include <array>
#include <cstddef>
#include <limits>
#include <optional>
#include <type_traits>
#include <vector>
#include <fuelhud/fuel_sample.hpp>

namespace fuelhud {

using Vec3 = std::array<double, 3>;

// --- Common

double linear_interp(double x, double x1, double y1, double x2, double y2);

// Euclidean distance between two world positions (m).
double distance(const Vec3& a, const Vec3& b);

double liter_to_gallon(double liter);

// Fractional part in [0,1) for any sign (floor based).
double frac(double x);

// --- Search

// Sort key of a row. Empty column: the row itself is the key.
template <class Row>
double search_key(const Row& row, std::optional<std::size_t> column = std::nullopt) {
  if constexpr (std::is_arithmetic_v<Row>) {
    (void)column;
    return static_cast<double>(row);
  } else {
    return row.at(column.value_or(0));
  }
}

// Index of the smallest key >= target in an unordered sequence.
// Falls back to the last index when nothing qualifies.
template <class Row>
std::size_t linear_search_higher_index(const std::vector<Row>& data, double target,
                                       std::optional<std::size_t> column = std::nullopt) {
  if (data.empty()) return 0;
  std::size_t end = data.size() - 1;
  double nearest = std::numeric_limits<double>::infinity();
  for (std::size_t i = 0; i < data.size(); ++i) {
    const double key = search_key(data[i], column);
    if (target <= key && key < nearest) {
      nearest = key;
      end = i;
    }
  }
  return end;
}

// First index in [start, end] whose key >= target; data must be sorted ascending.
template <class Row>
std::size_t binary_search_higher_index(const std::vector<Row>& data, double target,
                                       std::size_t start, std::size_t end,
                                       std::optional<std::size_t> column = std::nullopt) {
  while (start < end) {
    const std::size_t center = start + (end - start) / 2;
    const double key = search_key(data[center], column);
    if (target == key) return center;
    if (target > key) start = center + 1;
    else end = center;
  }
  return end;
}

// Live value minus the curve value interpolated at position (distance -> fuel used).
// Zero before the first real sample or when condition is false.
double delta_telemetry(double position, double live, const DeltaCurve& curve,
                       bool condition = true, double offset = 0.0);

// --- Race format

double lap_type_full_laps_remain(double laps_total, double laps_finished);
double lap_type_laps_remain(double laps_full_remain, double lap_into);
double time_type_full_laps_remain(double laptime_current, double laptime_last,
                                  double seconds_remain);
// delay: hold the previous value while the lap counter may be out of sync.
double time_type_laps_remain(double laps_full_remain, double lap_into,
                             double laps_remain, bool delay = false);

// --- Fuel

double total_fuel_needed(double laps_remain, double consumption, double fuel_in_tank);
double end_lap_consumption(double consumption, double consumption_delta, bool condition);
double end_stint_fuel(double fuel_in_tank, double consumption_into_lap, double consumption);
double end_stint_laps(double fuel_in_tank, double consumption);
double end_stint_minutes(double laps_total, double laptime_last);
double end_lap_empty_capacity(double capacity_total, double fuel_in_tank, double consumption);
double end_stint_pit_counts(double fuel_needed, double capacity_total);
double end_lap_pit_counts(double fuel_needed, double capacity_empty, double capacity_total);
double one_less_pit_stop_consumption(double pit_counts_late, double capacity_total,
                                     double fuel_in_tank, double laps_remain);

} // namespace fuelhud
