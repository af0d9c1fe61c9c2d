#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>
#include <spdlog/spdlog.h>
#include <fuelhud/config.hpp>
#include <fuelhud/fuel_metrics.hpp>
#include <fuelhud/fuel_runner.hpp>
#include <fuelhud/sim.hpp>

using namespace fuelhud;

// Headless run: drives one simulated session at high warp and logs every lap.
// Usage: fuel_cli [config.yaml] [laps] [warp]
int main(int argc, char** argv) {
  const std::string cfg_path = argc > 1 ? argv[1] : "config/fuelhud.yaml";
  const FuelConfig cfg = load_fuel_config(cfg_path);
  apply_log_level(cfg);

  SimConfig sim_cfg = load_sim_config(cfg_path);
  if (argc > 2) sim_cfg.max_laps = std::atoi(argv[2]);
  const double warp = argc > 3 ? std::atof(argv[3]) : 20.0;

  SimTelemetrySource sim(sim_cfg);
  sim.time_scale.store(warp > 0.0 ? warp : 1.0);
  MetricsBoard board(cfg.history_size);
  ModuleRegistry registry;
  FuelRunner runner(sim, board, cfg, registry);

  spdlog::info("fuel_cli: {} ({} laps, warp {}x)", sim.combo_id(), sim_cfg.max_laps, warp);
  runner.start();

  int logged_lap = -1;
  bool pit_asked = false;
  FuelMetrics m{};
  std::uint64_t cursor = 0;
  while (sim.driving()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    const auto hist = board.history();
    if (!hist.empty() && hist.front().lap != logged_lap) {
      const auto& r = hist.front();
      logged_lap = r.lap;
      spdlog::info("lap {:3d}  time {:7.3f}  used {:6.3f}  fuel {:6.2f}/{:.0f}{}",
                   r.lap, r.laptime, r.used, r.fuel, r.capacity, r.valid ? "" : "  (invalid)");
    }

    if (board.try_consume_latest(cursor, m)) {
      // Pit once the tank will not see the next lap through
      const bool low = m.estimated_laps > 0.0 && m.estimated_laps < 1.5 && m.amount_needed > 0.0;
      if (low && !pit_asked) {
        spdlog::info("fuel_cli: pit requested, {:.2f} laps of fuel left, {:+.2f} needed",
                     m.estimated_laps, m.amount_needed);
        sim.request_pit();
        pit_asked = true;
      } else if (!low) {
        pit_asked = false;
      }
    }
  }

  // Give the runner one idle poll to close the session and save the curve
  std::this_thread::sleep_for(std::chrono::milliseconds(cfg.idle_update_interval_ms + 50));
  runner.stop();

  const auto final_m = board.latest();
  spdlog::info("fuel_cli: finished, fuel {:.2f}, last lap used {:.3f}, curve at '{}'",
               final_m.amount_current, final_m.last_lap_consumption,
               runner.store().path_for(sim.combo_id()).string());
  return 0;
}
