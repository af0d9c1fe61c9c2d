#pragma once
#include <cmath>
#include <cstddef>
#include <vector>

namespace fuelhud {

// One point of a delta fuel curve.
// Terminal sample of a lap: fuel_used = lap total, lap_time = lap duration.
struct FuelSample {
  double distance = 0.0;   // meters into lap
  double fuel_used = 0.0;  // fuel used since lap start
  double lap_time = 0.0;   // seconds, terminal sample only

  // Column access for the search helpers: 0 distance, 1 fuel used, 2 lap time.
  double at(std::size_t column) const {
    switch (column) {
      case 1:  return fuel_used;
      case 2:  return lap_time;
      default: return distance;
    }
  }

  bool operator==(const FuelSample&) const = default;
};

using DeltaCurve = std::vector<FuelSample>;

inline constexpr std::size_t kColDistance = 0;
inline constexpr std::size_t kColFuelUsed = 1;
inline constexpr std::size_t kColLapTime  = 2;

// Curve used when no stored curve is available.
inline DeltaCurve default_delta_curve() {
  return DeltaCurve{FuelSample{99999.0, 0.0, 0.0}};
}

// Storage precision (6 decimals).
inline double round6(double v) {
  return std::round(v * 1e6) / 1e6;
}

} // namespace fuelhud
