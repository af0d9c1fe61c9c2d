#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <vector>

#include <fuelhud/viewer/app.hpp>
#include <fuelhud/fuel_runner.hpp>
#include <fuelhud/track_geom.hpp>

namespace fuelhud {

namespace {

static const char* warpLabel(double w) {
  if (w == 0.0)  return "Paused";
  if (w == 1.0)  return "1x";
  if (w == 2.0)  return "2x";
  if (w == 4.0)  return "4x";
  if (w == 8.0)  return "8x";
  if (w == 16.0) return "16x";
  return "custom";
}

static void fmt_time(double s, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (s <= 0.0 || !std::isfinite(s)) { std::snprintf(out, (size_t)cap, "%s", "--"); return; }
  int minutes = (int)(s / 60.0);
  double rem  = s - minutes * 60.0;
  int secs    = (int)rem;
  int ms      = (int)((rem - secs) * 1000.0 + 0.5);
  if (minutes > 0) std::snprintf(out, (size_t)cap, "%d:%02d.%03d", minutes, secs, ms);
  else             std::snprintf(out, (size_t)cap, "%d.%03d", secs, ms);
}

// Widget layout
static constexpr int kCellW      = 64;
static constexpr int kCellH      = 26;
static constexpr int kCaptionH   = 14;
static constexpr int kLevelBarH  = 8;
static constexpr int kWidgetGap  = 4;

static const Color kCellBg      {24, 24, 28, 220};
static const Color kCellFg      {220, 220, 230, 255};
static const Color kCaptionFg   {150, 150, 160, 255};
static const Color kLowFuelBg   {190, 40, 40, 230};
static const Color kLevelBg     {40, 40, 46, 230};
static const Color kLevelFill   {230, 190, 60, 255};
static const Color kStartMark   {240, 240, 240, 255};
static const Color kRefillMark  {80, 200, 120, 255};

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(SimTelemetrySource& sim, MetricsBoard& board, FuelRunner& runner)
  : sim_(sim), board_(board), runner_(runner) {}

ViewerApp::Vec2f ViewerApp::worldToScreen_(double x, double y, float scale) const {
  const float cx = GetScreenWidth()  * 0.5f + pan_x_m_ * scale;
  const float cy = GetScreenHeight() * 0.5f - pan_y_m_ * scale;
  return { cx + float(x * scale), cy - float(y * scale) };
}

int ViewerApp::run() {
  const int W = 1024, H = 768;
  InitWindow(W, H, "fuelhud - Viewer");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    pump_metrics_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  if (IsKeyPressed(KEY_SPACE)) {
    double cur = sim_.time_scale.load();
    sim_.time_scale.store(cur == 0.0 ? 1.0 : 0.0);
  }
  if (IsKeyPressed(KEY_ONE))   sim_.time_scale.store(1.0);
  if (IsKeyPressed(KEY_TWO))   sim_.time_scale.store(2.0);
  if (IsKeyPressed(KEY_THREE)) sim_.time_scale.store(4.0);
  if (IsKeyPressed(KEY_FOUR))  sim_.time_scale.store(8.0);
  if (IsKeyPressed(KEY_FIVE))  sim_.time_scale.store(16.0);

  if (IsKeyPressed(KEY_P)) sim_.request_pit();
  if (IsKeyPressed(KEY_R)) sim_.restart();
  if (IsKeyPressed(KEY_U)) {
    display_.unit = display_.unit == FuelUnit::Liter ? FuelUnit::Gallon : FuelUnit::Liter;
  }

  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_KP_ADD))      scale_px_per_m_ *= 1.01f;
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_KP_SUBTRACT)) scale_px_per_m_ *= 0.99f;
}

void ViewerApp::pump_metrics_() {
  (void)board_.try_consume_latest(cursor_, metrics_);
}

void ViewerApp::render_frame_() {
  const SimServer view = sim_.snapshot();

  BeginDrawing();
  ClearBackground(Color{30, 60, 30, 255});

  draw_track_(view, scale_px_per_m_);

  double x, y, heading;
  view.sample_pose(x, y, heading);
  const auto p = worldToScreen_(x, y, scale_px_per_m_);
  const Vector2 pos{p.x, p.y};
  const float len = 12.0f, wid = 6.0f;
  const float c = std::cos(float(heading)), s = std::sin(float(heading));
  const Vector2 nose  = { pos.x + c*len,          pos.y - s*len };
  const Vector2 tailL = { pos.x - c*len + s*wid,  pos.y + s*len + c*wid };
  const Vector2 tailR = { pos.x - c*len - s*wid,  pos.y + s*len - c*wid };
  const Color car = view.in_pits() ? Color{241, 196, 15, 255} : Color{231, 76, 60, 255};
  DrawTriangle(nose, tailL, tailR, car);
  DrawCircleV(pos, 3.0f, car);

  draw_hud_(view);
  draw_fuel_widget_(20, 110);
  draw_history_(20, 110 + 2 * (kCaptionH + kCellH) + kLevelBarH + 3 * kWidgetGap + 20);
  EndDrawing();
}

void ViewerApp::draw_track_(const SimServer& view, float scale_px_per_m) {
  const auto& pts = view.track().points();
  if (pts.size() < 2) return;

  const float width_m = 12.0f;
  const float half_w_px = 0.5f * width_m * scale_px_per_m;

  for (std::size_t i = 1; i < pts.size(); ++i) {
    auto a = worldToScreen_(pts[i-1].x, pts[i-1].y, scale_px_per_m);
    auto b = worldToScreen_(pts[i].x,   pts[i].y,   scale_px_per_m);
    DrawLineEx({a.x,a.y}, {b.x,b.y}, half_w_px*2.0f, Color{40,40,46,255});
  }

  // Start/finish line
  auto a = worldToScreen_(pts[0].x, pts[0].y, scale_px_per_m);
  auto b = worldToScreen_(pts[1].x, pts[1].y, scale_px_per_m);
  const float dx = b.x - a.x, dy = b.y - a.y;
  const float l = std::sqrt(dx*dx + dy*dy);
  if (l > 0.1f) {
    const Vector2 n = { -dy / l, dx / l };
    DrawLineEx({a.x - n.x*half_w_px, a.y - n.y*half_w_px},
               {a.x + n.x*half_w_px, a.y + n.y*half_w_px}, 4.0f, Color{240,240,240,255});
  }
}

void ViewerApp::draw_fuel_widget_(int x0, int y0) {
  const FuelCells cells = format_fuel_cells(metrics_, display_);
  const int row_h = kCaptionH + kCellH;

  auto draw_cell = [&](const FuelCell& cell, int x, int y, bool caption_above) {
    const int cap_y  = caption_above ? y : y + kCellH;
    const int text_y = caption_above ? y + kCaptionH : y;
    DrawRectangle(x, text_y, kCellW, kCellH, cell.warning ? kLowFuelBg : kCellBg);
    DrawText(cell.text.c_str(), x + 6, text_y + 5, 18, kCellFg);
    DrawText(cell.caption, x + 6, cap_y, 12, kCaptionFg);
  };

  // Upper row: end, remain, refuel, used, delta
  for (int i = 0; i < 5; ++i) draw_cell(cells[i], x0 + i * kCellW, y0, true);

  // Level bar with start and refill marks
  const int bar_y = y0 + row_h + kWidgetGap;
  const int bar_w = 5 * kCellW;
  const FuelLevel lv = fuel_level(metrics_);
  DrawRectangle(x0, bar_y, bar_w, kLevelBarH, kLevelBg);
  DrawRectangle(x0, bar_y, int(std::clamp(lv.current, 0.0, 1.0) * bar_w), kLevelBarH, kLevelFill);
  DrawRectangle(x0 + int(std::clamp(lv.start, 0.0, 1.0) * bar_w) - 1, bar_y, 2, kLevelBarH, kStartMark);
  DrawRectangle(x0 + int(std::clamp(lv.refill, 0.0, 1.0) * bar_w) - 1, bar_y, 2, kLevelBarH, kRefillMark);

  // Lower row: early, laps, mins, save, pits
  const int lower_y = bar_y + kLevelBarH + kWidgetGap;
  for (int i = 0; i < 5; ++i) draw_cell(cells[5 + i], x0 + i * kCellW, lower_y, false);
}

void ViewerApp::draw_history_(int x0, int y0) {
  const auto hist = board_.history();
  const int row_h = 16;
  const int rows = std::min<int>(int(hist.size()), 8);

  DrawText("Lap   Time       Used     Fuel", x0, y0, 14, Color{220,220,230,255});
  char buf_time[32];
  for (int i = 0; i < rows; ++i) {
    const auto& r = hist[i];
    fmt_time(r.laptime, buf_time, sizeof(buf_time));
    DrawText(TextFormat("%3d   %-9s  %6.2f   %6.2f",
                        r.lap, buf_time,
                        to_display_unit(r.used, display_.unit),
                        to_display_unit(r.fuel, display_.unit)),
             x0, y0 + (i + 1) * row_h, 14,
             r.valid ? Color{200,200,210,255} : Color{140,140,150,255});
  }
}

void ViewerApp::draw_hud_(const SimServer& view) {
  const double warp = sim_.time_scale.load();
  const auto f = view.frame();

  const char* race = view.lap_type_race()
    ? TextFormat("Race: lap %d/%d", f.lap_number + 1, f.lap_max)
    : TextFormat("Race: %.0fs left", f.time_remaining);

  DrawText(TextFormat("%s  %s  sim=%.1fs  warp=%s  fuel=%s",
                      view.combo_id().c_str(),
                      race,
                      view.session_time(),
                      warpLabel(warp),
                      runner_.running() ? "running" : "stopped"),
           20, 20, 20, Color{220,235,220,255});

  const char* state = !view.driving() ? "Finished (R: restart)"
                    : view.in_pits() ? "In pits"
                    : view.pit_requested() ? "Pit requested" : "On track";
  DrawText(TextFormat("%s  units=%s", state,
                      display_.unit == FuelUnit::Liter ? "L" : "gal"),
           20, 46, 18, Color{235,220,220,255});

  DrawText("Space: Pause/Resume | 1..5: 1x 2x 4x 8x 16x | P: Pit | U: Units | R: Restart | W/S: Zoom",
           20, 72, 14, Color{190,205,190,255});
}

} // namespace fuelhud
