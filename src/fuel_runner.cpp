#include <fuelhud/fuel_runner.hpp>
#include <chrono>
#include <spdlog/spdlog.h>

namespace fuelhud {

FuelRunner::FuelRunner(TelemetrySource& source, MetricsBoard& board,
                       const FuelConfig& cfg, ModuleRegistry& registry)
  : source_(source), board_(board), cfg_(cfg), registry_(registry),
    store_(cfg.curve_directory, cfg.curve_extension) {}

void FuelRunner::start() {
  if (running_.load()) return;
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = false;
  }
  running_.store(true);
  registry_.add(kModuleName);
  spdlog::info("ACTIVE: module fuel");
  th_ = std::thread(&FuelRunner::thread_main_, this);
}

void FuelRunner::stop() {
  if (!running_.load()) return;
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (th_.joinable()) th_.join();
  running_.store(false);
}

// Returns false once stop was requested.
bool FuelRunner::wait_(int interval_ms) {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait_for(lock, std::chrono::milliseconds(interval_ms),
               [this] { return stop_requested_; });
  return !stop_requested_;
}

void FuelRunner::thread_main_() {
  FuelEngine engine(cfg_.thresholds);
  bool active = false;

  auto close_session = [&] {
    if (engine.end_session(store_)) {
      spdlog::info("fuel: saved reference curve for '{}'", engine.combo());
    }
  };

  while (wait_(active ? cfg_.update_interval_ms : cfg_.idle_update_interval_ms)) {
    if (!source_.driving()) {
      if (active) {
        active = false;
        close_session();
      }
      continue;
    }

    if (!active) {
      active = true;
      const std::string combo = source_.combo_id();
      engine.reset(combo, store_);
      board_.clear_history();
      sessions_.fetch_add(1, std::memory_order_relaxed);
      spdlog::debug("fuel: session started for '{}'", combo);
    }

    engine.tick(sanitize(source_.read()), board_);
    ticks_.fetch_add(1, std::memory_order_relaxed);
  }

  close_session();
  registry_.remove(kModuleName);
  spdlog::info("CLOSED: module fuel");
}

} // namespace fuelhud
