#pragma once
#include <string>
#include <fuelhud/calc.hpp>

namespace fuelhud {

// Point-in-time player vehicle readings consumed by the fuel engine.
// Unavailable values read as 0 (see sanitize()).
struct TelemetryFrame {
  // Timing
  double lap_start_time = 0.0;     // session time at current lap start (s)
  double current_laptime = 0.0;    // seconds into current lap
  double last_laptime = 0.0;       // last completed lap (s), <= 0 if invalid/unset
  double time_remaining = 0.0;     // session time left (s)

  // Vehicle
  double fuel = 0.0;               // liters
  double tank_capacity = 0.0;      // liters
  bool in_garage = false;
  bool in_pits = false;
  Vec3 position{0.0, 0.0, 0.0};    // world position (m)

  // Lap
  double lap_distance = 0.0;       // meters into lap
  double lap_progress = 0.0;       // fraction of lap [0,1)
  int lap_number = 0;              // completed laps
  int lap_max = 0;                 // race length in laps, lap-type only

  // Session
  bool lap_type_race = false;      // false: time-type race
};

// Read side of a simulator binding.
class TelemetrySource {
public:
  virtual ~TelemetrySource() = default;

  // Player is on track in an active session.
  virtual bool driving() = 0;
  // Track + vehicle class identifier, already stripped of path-unsafe characters.
  virtual std::string combo_id() = 0;
  virtual TelemetryFrame read() = 0;
};

// NaN/inf -> 0 for every numeric field.
double sanitize_number(double v);
TelemetryFrame sanitize(TelemetryFrame f);

// Remove \ / : * ? " < > | from a file name component.
std::string strip_invalid_char(const std::string& name);

// "<track> - <class>", sanitized.
std::string make_combo_id(const std::string& track, const std::string& vehicle_class);

} // namespace fuelhud
