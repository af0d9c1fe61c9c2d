#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>
#include <fuelhud/latest_buffer.hpp>

namespace fuelhud {

// Derived fuel values published once per engine tick. Fuel in liters.
struct FuelMetrics {
  double capacity = 0.0;
  double amount_start = 0.0;            // fuel at stint start
  double amount_current = 0.0;
  double amount_needed = 0.0;           // additional fuel to finish the race
  double amount_before_pitstop = 0.0;   // fuel left at the end of the stint
  double last_lap_consumption = 0.0;    // raw usage of the last completed lap
  double estimated_consumption = 0.0;   // baseline + delta
  double delta_consumption = 0.0;       // live usage vs reference curve
  double estimated_laps = 0.0;          // laps the current fuel lasts
  double estimated_minutes = 0.0;
  double estimated_empty_capacity = 0.0;   // at end of current lap
  double estimated_pits_end = 0.0;         // pitting at end of stint
  double estimated_pits_early = 0.0;       // pitting at end of current lap
  double one_less_pit_consumption = 0.0;   // per-lap target to save one stop
};

struct ConsumptionRecord {
  int lap = 0;
  double laptime = 0.0;
  double used = 0.0;       // raw lap usage
  double fuel = 0.0;       // fuel in tank when recorded
  double capacity = 0.0;
  bool valid = false;      // simulator reported a valid last laptime
};

// Injected output channel between the fuel engine and display widgets.
class MetricsBoard {
public:
  explicit MetricsBoard(std::size_t history_capacity = 100)
    : history_cap_(history_capacity ? history_capacity : 1) {}

  void publish(const FuelMetrics& m) { metrics_.publish(m); }
  bool try_consume_latest(std::uint64_t& cursor, FuelMetrics& out) const {
    return metrics_.try_consume_latest(cursor, out);
  }
  FuelMetrics latest() const { return metrics_.latest(); }

  // Most-recent-first, bounded.
  void push_history(const ConsumptionRecord& r) {
    std::lock_guard<std::mutex> lock(history_mu_);
    history_.push_front(r);
    while (history_.size() > history_cap_) history_.pop_back();
  }

  std::vector<ConsumptionRecord> history() const {
    std::lock_guard<std::mutex> lock(history_mu_);
    return {history_.begin(), history_.end()};
  }

  void clear_history() {
    std::lock_guard<std::mutex> lock(history_mu_);
    history_.clear();
  }

  std::size_t history_capacity() const { return history_cap_; }

private:
  LatestBuffer<FuelMetrics> metrics_;
  mutable std::mutex history_mu_;
  std::deque<ConsumptionRecord> history_;
  std::size_t history_cap_;
};

} // namespace fuelhud
