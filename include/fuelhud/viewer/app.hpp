#pragma once
#include <cstdint>
#include <fuelhud/fuel_display.hpp>
#include <fuelhud/fuel_metrics.hpp>
#include <fuelhud/sim.hpp>

namespace fuelhud {

class FuelRunner;

// Renders the simulated track and the fuel widget from the latest metrics.
class ViewerApp {
public:
  ViewerApp(SimTelemetrySource& sim, MetricsBoard& board, FuelRunner& runner);
  int run(); // returns 0 on normal exit

private:
  void process_input_();
  void pump_metrics_();
  void render_frame_();
  void draw_track_(const SimServer& view, float scale_px_per_m);
  void draw_fuel_widget_(int x0, int y0);
  void draw_history_(int x0, int y0);
  void draw_hud_(const SimServer& view);

  struct Vec2f { float x; float y; };
  Vec2f worldToScreen_(double x, double y, float scale) const;

  SimTelemetrySource& sim_;
  MetricsBoard& board_;
  FuelRunner& runner_;

  FuelMetrics metrics_{};
  std::uint64_t cursor_{0};
  FuelDisplayConfig display_{};

  float scale_px_per_m_{1.6f};
  float pan_x_m_{0.0f};
  float pan_y_m_{-60.0f};
};

} // namespace fuelhud
