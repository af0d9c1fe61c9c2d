#include <fuelhud/telemetry.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>

namespace fuelhud {

double sanitize_number(double v) {
  return std::isfinite(v) ? v : 0.0;
}

TelemetryFrame sanitize(TelemetryFrame f) {
  f.lap_start_time  = sanitize_number(f.lap_start_time);
  f.current_laptime = sanitize_number(f.current_laptime);
  f.last_laptime    = sanitize_number(f.last_laptime);
  f.time_remaining  = sanitize_number(f.time_remaining);
  f.fuel            = sanitize_number(f.fuel);
  f.tank_capacity   = sanitize_number(f.tank_capacity);
  for (auto& p : f.position) p = sanitize_number(p);
  f.lap_distance    = sanitize_number(f.lap_distance);
  f.lap_progress    = sanitize_number(f.lap_progress);
  return f;
}

std::string strip_invalid_char(const std::string& name) {
  static const std::string kInvalid = "\\/:*?\"<>|";
  std::string out;
  out.reserve(name.size());
  std::copy_if(name.begin(), name.end(), std::back_inserter(out),
               [](char c){ return kInvalid.find(c) == std::string::npos; });
  return out;
}

std::string make_combo_id(const std::string& track, const std::string& vehicle_class) {
  return strip_invalid_char(track + " - " + vehicle_class);
}

} // namespace fuelhud
