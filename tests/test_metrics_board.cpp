#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <thread>
#include <fuelhud/fuel_metrics.hpp>

using namespace fuelhud;

TEST_CASE("MetricsBoard delivers only new metrics per cursor") {
  MetricsBoard board;
  std::uint64_t cursor = 0;
  FuelMetrics out;
  REQUIRE_FALSE(board.try_consume_latest(cursor, out));

  FuelMetrics m;
  m.amount_current = 12.5;
  board.publish(m);
  REQUIRE(board.try_consume_latest(cursor, out));
  REQUIRE(out.amount_current == 12.5);
  REQUIRE_FALSE(board.try_consume_latest(cursor, out));

  // Readers only see the newest value
  m.amount_current = 11.0; board.publish(m);
  m.amount_current = 10.0; board.publish(m);
  REQUIRE(board.try_consume_latest(cursor, out));
  REQUIRE(out.amount_current == 10.0);

  // Independent cursor
  std::uint64_t other = 0;
  REQUIRE(board.try_consume_latest(other, out));
  REQUIRE(board.latest().amount_current == 10.0);
}

TEST_CASE("MetricsBoard history is most-recent-first and bounded") {
  MetricsBoard board(3);
  for (int lap = 0; lap < 5; ++lap) {
    board.push_history(ConsumptionRecord{lap, 90.0, 2.5, 50.0 - lap, 100.0, true});
  }
  const auto hist = board.history();
  REQUIRE(hist.size() == 3);
  REQUIRE(hist[0].lap == 4);
  REQUIRE(hist[2].lap == 2);

  board.clear_history();
  REQUIRE(board.history().empty());
  REQUIRE(MetricsBoard(0).history_capacity() == 1);
}

TEST_CASE("MetricsBoard tolerates a concurrent writer") {
  MetricsBoard board;
  std::thread writer([&] {
    FuelMetrics m;
    for (int i = 1; i <= 2000; ++i) {
      m.amount_current = i;
      m.capacity = i;
      board.publish(m);
    }
  });

  std::uint64_t cursor = 0;
  FuelMetrics out;
  double last = 0.0;
  for (int i = 0; i < 2000; ++i) {
    if (board.try_consume_latest(cursor, out)) {
      REQUIRE(out.amount_current == out.capacity);  // never torn
      REQUIRE(out.amount_current >= last);
      last = out.amount_current;
    }
  }
  writer.join();
  REQUIRE(board.latest().amount_current == 2000.0);
}
