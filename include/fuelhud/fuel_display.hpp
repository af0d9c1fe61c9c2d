#pragma once
#include <array>
#include <string>
#include <fuelhud/fuel_metrics.hpp>

namespace fuelhud {

enum class FuelUnit { Liter, Gallon };

struct FuelDisplayConfig {
  FuelUnit unit = FuelUnit::Liter;
  int bar_width = 5;                  // characters per cell
  double low_fuel_lap_threshold = 2.0;
  // Decimal places per cell, in FuelCellId order, clamped to [0,3]
  std::array<int, 10> decimals{2, 2, 2, 2, 2, 1, 1, 1, 2, 2};
};

enum FuelCellId : int {
  kCellEndStint = 0,
  kCellRemain,
  kCellRefuel,
  kCellUsed,
  kCellDelta,
  kCellPitsEarly,
  kCellLaps,
  kCellMinutes,
  kCellSave,
  kCellPitsEnd,
  kCellCount
};

struct FuelCell {
  const char* caption = "";
  std::string text;
  bool warning = false;   // low fuel highlight
};

using FuelCells = std::array<FuelCell, kCellCount>;

// Text for the ten widget cells, truncated to bar_width.
FuelCells format_fuel_cells(const FuelMetrics& m, const FuelDisplayConfig& cfg = {});

// Level bar positions as fractions of capacity.
struct FuelLevel {
  double current = 0.0;
  double start = 0.0;
  double refill = 0.0;
};
FuelLevel fuel_level(const FuelMetrics& m);

double to_display_unit(double liters, FuelUnit unit);

} // namespace fuelhud
