#include <string>
#include <fuelhud/config.hpp>
#include <fuelhud/fuel_metrics.hpp>
#include <fuelhud/fuel_runner.hpp>
#include <fuelhud/sim.hpp>
#include <fuelhud/viewer/app.hpp>

using namespace fuelhud;

int main(int argc, char** argv) {
  const std::string cfg_path = argc > 1 ? argv[1] : "config/fuelhud.yaml";
  const FuelConfig cfg = load_fuel_config(cfg_path);
  apply_log_level(cfg);

  SimTelemetrySource sim(load_sim_config(cfg_path));
  MetricsBoard board(cfg.history_size);
  ModuleRegistry registry;
  FuelRunner runner(sim, board, cfg, registry);
  runner.start();

  ViewerApp app(sim, board, runner);
  const int code = app.run();

  runner.stop();
  return code;
}
