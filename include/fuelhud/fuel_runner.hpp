#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <fuelhud/config.hpp>
#include <fuelhud/fuel_curve.hpp>
#include <fuelhud/fuel_engine.hpp>
#include <fuelhud/fuel_metrics.hpp>
#include <fuelhud/telemetry.hpp>

namespace fuelhud {

// Names of the background modules currently running.
class ModuleRegistry {
public:
  void add(const std::string& name) {
    std::lock_guard<std::mutex> lock(mu_);
    names_.insert(name);
  }
  void remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mu_);
    names_.erase(name);
  }
  bool contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    return names_.count(name) != 0;
  }
  std::vector<std::string> names() const {
    std::lock_guard<std::mutex> lock(mu_);
    return {names_.begin(), names_.end()};
  }

private:
  mutable std::mutex mu_;
  std::set<std::string> names_;
};

// Owns the fuel engine thread. Polls the telemetry source at the active rate
// while driving and at the idle rate otherwise.
class FuelRunner {
public:
  static constexpr const char* kModuleName = "module_fuel";

  FuelRunner(TelemetrySource& source, MetricsBoard& board,
             const FuelConfig& cfg, ModuleRegistry& registry);
  ~FuelRunner() { stop(); }
  FuelRunner(const FuelRunner&) = delete;
  FuelRunner& operator=(const FuelRunner&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // Active ticks since start (tests and diagnostics).
  std::uint64_t ticks() const { return ticks_.load(std::memory_order_relaxed); }
  std::uint64_t sessions() const { return sessions_.load(std::memory_order_relaxed); }

  const FuelCurveStore& store() const { return store_; }

private:
  void thread_main_();
  bool wait_(int interval_ms);

  TelemetrySource& source_;
  MetricsBoard& board_;
  FuelConfig cfg_;
  ModuleRegistry& registry_;
  FuelCurveStore store_;

  std::thread th_;
  std::atomic<bool> running_{false};
  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_{false};

  std::atomic<std::uint64_t> ticks_{0};
  std::atomic<std::uint64_t> sessions_{0};
};

} // namespace fuelhud
