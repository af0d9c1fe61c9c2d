#include <catch2/catch_test_macros.hpp>
#include <limits>
#include <fuelhud/telemetry.hpp>

using namespace fuelhud;

TEST_CASE("sanitize coerces non-finite readings to zero") {
  constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
  constexpr double kInf = std::numeric_limits<double>::infinity();

  TelemetryFrame f;
  f.fuel = kNaN;
  f.tank_capacity = kInf;
  f.lap_distance = -kInf;
  f.position = Vec3{1.0, kNaN, 3.0};
  f.current_laptime = 12.5;
  f.lap_number = 4;

  const auto s = sanitize(f);
  REQUIRE(s.fuel == 0.0);
  REQUIRE(s.tank_capacity == 0.0);
  REQUIRE(s.lap_distance == 0.0);
  REQUIRE(s.position[0] == 1.0);
  REQUIRE(s.position[1] == 0.0);
  REQUIRE(s.current_laptime == 12.5);
  REQUIRE(s.lap_number == 4);
}

TEST_CASE("Combo ids are safe file names") {
  REQUIRE(strip_invalid_char(R"(a\b/c:d*e?f"g<h>i|j)") == "abcdefghij");
  REQUIRE(strip_invalid_char("Spa 2023") == "Spa 2023");
  REQUIRE(make_combo_id("Le Mans: 24h", "Hypercar") == "Le Mans 24h - Hypercar");
}
