#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>

#include <fuelhud/fuel_runner.hpp>
#include <fuelhud/sim.hpp>

using namespace fuelhud;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

struct TempDir {
  fs::path path;
  TempDir() {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path = fs::temp_directory_path() / ("fuelhud_runner_" + std::to_string(stamp));
    fs::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

// Parked car; driving state toggled by the test.
class ToggleSource : public TelemetrySource {
public:
  std::atomic<bool> on_track{false};
  std::atomic<int> reads{0};

  bool driving() override { return on_track.load(); }
  std::string combo_id() override { return "Test Track - Test Class"; }
  TelemetryFrame read() override {
    ++reads;
    TelemetryFrame f;
    f.fuel = 50.0;
    f.tank_capacity = 100.0;
    return f;
  }
};

// Simulator advanced by a fixed step per read, independent of wall time.
class SteppedSimSource : public TelemetrySource {
public:
  explicit SteppedSimSource(const SimConfig& cfg) : sim_(cfg) {}

  bool driving() override {
    std::lock_guard<std::mutex> lock(mu_);
    return sim_.driving();
  }
  std::string combo_id() override {
    std::lock_guard<std::mutex> lock(mu_);
    return sim_.combo_id();
  }
  TelemetryFrame read() override {
    std::lock_guard<std::mutex> lock(mu_);
    sim_.step(0.05);
    return sim_.frame();
  }

private:
  std::mutex mu_;
  SimServer sim_;
};

FuelConfig fast_config(const fs::path& dir) {
  FuelConfig cfg;
  cfg.update_interval_ms = 1;
  cfg.idle_update_interval_ms = 5;
  cfg.curve_directory = dir.string();
  return cfg;
}

template <class Pred>
bool wait_for(Pred pred, std::chrono::milliseconds timeout = 5000ms) {
  const auto until = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < until) {
    if (pred()) return true;
    std::this_thread::sleep_for(1ms);
  }
  return pred();
}

} // namespace

TEST_CASE("FuelRunner start and stop are idempotent") {
  TempDir tmp;
  ToggleSource src;
  MetricsBoard board;
  ModuleRegistry registry;
  FuelRunner runner(src, board, fast_config(tmp.path), registry);

  runner.stop();  // never started
  REQUIRE_FALSE(runner.running());

  runner.start();
  runner.start();
  REQUIRE(runner.running());
  REQUIRE(registry.contains(FuelRunner::kModuleName));
  REQUIRE(registry.names().size() == 1);

  runner.stop();
  runner.stop();
  REQUIRE_FALSE(runner.running());
  REQUIRE_FALSE(registry.contains(FuelRunner::kModuleName));

  // Restartable
  runner.start();
  REQUIRE(registry.contains(FuelRunner::kModuleName));
  runner.stop();
  REQUIRE(registry.names().empty());
}

TEST_CASE("FuelRunner stop wakes a long idle wait") {
  TempDir tmp;
  ToggleSource src;
  MetricsBoard board;
  ModuleRegistry registry;
  FuelConfig cfg = fast_config(tmp.path);
  cfg.idle_update_interval_ms = 60000;
  FuelRunner runner(src, board, cfg, registry);

  runner.start();
  std::this_thread::sleep_for(20ms);
  const auto t0 = std::chrono::steady_clock::now();
  runner.stop();
  REQUIRE(std::chrono::steady_clock::now() - t0 < 2s);
}

TEST_CASE("FuelRunner ticks only while driving and resets per session") {
  TempDir tmp;
  ToggleSource src;
  MetricsBoard board;
  ModuleRegistry registry;
  FuelRunner runner(src, board, fast_config(tmp.path), registry);
  runner.start();

  std::this_thread::sleep_for(30ms);
  REQUIRE(runner.ticks() == 0);
  REQUIRE(src.reads.load() == 0);

  src.on_track = true;
  REQUIRE(wait_for([&] { return runner.ticks() > 5; }));
  REQUIRE(runner.sessions() == 1);

  std::uint64_t cursor = 0;
  FuelMetrics m;
  REQUIRE(board.try_consume_latest(cursor, m));
  REQUIRE(m.amount_current == 50.0);
  REQUIRE(m.capacity == 100.0);

  src.on_track = false;
  std::this_thread::sleep_for(30ms);
  const auto idle_ticks = runner.ticks();
  std::this_thread::sleep_for(30ms);
  REQUIRE(runner.ticks() == idle_ticks);

  src.on_track = true;
  REQUIRE(wait_for([&] { return runner.sessions() == 2; }));
  runner.stop();
}

TEST_CASE("FuelRunner saves the reference curve when the session ends") {
  TempDir tmp;
  SimConfig sim_cfg;
  sim_cfg.max_laps = 3;
  SteppedSimSource src(sim_cfg);
  MetricsBoard board;
  ModuleRegistry registry;
  FuelRunner runner(src, board, fast_config(tmp.path), registry);

  const auto file = runner.store().path_for(src.combo_id());
  REQUIRE_FALSE(fs::exists(file));

  runner.start();
  REQUIRE(wait_for([&] { return !src.driving(); }, 30000ms));
  REQUIRE(wait_for([&] { return fs::exists(file); }));
  runner.stop();

  const auto loaded = runner.store().load(src.combo_id());
  REQUIRE(loaded.status == CurveStatus::Loaded);
  REQUIRE(loaded.curve.size() > kMinSavedSamples);
  REQUIRE(loaded.used_last > 0.0);
  REQUIRE(board.history().size() >= 2);
}
