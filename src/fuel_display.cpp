#include <fuelhud/fuel_display.hpp>
#include <algorithm>
#include <cstdio>
#include <fuelhud/calc.hpp>

namespace fuelhud {

static const char* const kCaptions[kCellCount] = {
  "end", "remain", "refuel", "used", "delta",
  "early", "laps", "mins", "save", "pits",
};

static std::string fixed(double v, int decimals, bool sign = false) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), sign ? "%+.*f" : "%.*f", std::clamp(decimals, 0, 3), v);
  return buf;
}

// Cut to width, then drop dangling dots on either side.
static std::string fit(std::string s, int width) {
  if (width > 0 && s.size() > static_cast<std::size_t>(width)) s.resize(static_cast<std::size_t>(width));
  const auto b = s.find_first_not_of('.');
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of('.');
  return s.substr(b, e - b + 1);
}

double to_display_unit(double liters, FuelUnit unit) {
  return unit == FuelUnit::Gallon ? liter_to_gallon(liters) : liters;
}

FuelCells format_fuel_cells(const FuelMetrics& m, const FuelDisplayConfig& cfg) {
  auto unit = [&](double v) { return to_display_unit(v, cfg.unit); };
  auto pits = [](double v) { return std::clamp(v, 0.0, 99.99); };
  const auto& d = cfg.decimals;
  const bool low = m.estimated_laps <= cfg.low_fuel_lap_threshold;

  FuelCells cells;
  cells[kCellEndStint].text  = fixed(unit(m.amount_before_pitstop), d[kCellEndStint]);
  cells[kCellRemain].text    = fixed(unit(m.amount_current), d[kCellRemain]);
  cells[kCellRefuel].text    = fixed(std::clamp(unit(m.amount_needed), -9999.0, 9999.0), d[kCellRefuel], true);
  cells[kCellUsed].text      = fixed(unit(m.estimated_consumption), d[kCellUsed]);
  cells[kCellDelta].text     = fixed(unit(m.delta_consumption), d[kCellDelta], true);
  cells[kCellPitsEarly].text = fixed(pits(m.estimated_pits_early), d[kCellPitsEarly]);
  cells[kCellLaps].text      = fixed(std::min(m.estimated_laps, 9999.0), d[kCellLaps]);
  cells[kCellMinutes].text   = fixed(std::min(m.estimated_minutes, 9999.0), d[kCellMinutes]);
  cells[kCellSave].text      = fixed(std::clamp(unit(m.one_less_pit_consumption), 0.0, 99.99), d[kCellSave]);
  cells[kCellPitsEnd].text   = fixed(pits(m.estimated_pits_end), d[kCellPitsEnd]);

  const int width = std::max(cfg.bar_width, 3);
  for (int i = 0; i < kCellCount; ++i) {
    cells[i].caption = kCaptions[i];
    cells[i].text = fit(cells[i].text, width);
  }
  cells[kCellRemain].warning = low;
  cells[kCellRefuel].warning = low;
  return cells;
}

FuelLevel fuel_level(const FuelMetrics& m) {
  if (m.capacity <= 0.0) return {};
  return FuelLevel{
    m.amount_current / m.capacity,
    m.amount_start / m.capacity,
    (m.amount_current + m.amount_needed) / m.capacity,
  };
}

} // namespace fuelhud
