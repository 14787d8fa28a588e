#include "util/duration.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <stdexcept>

using namespace hostlogin;
using namespace std::chrono;

TEST_CASE("parse_duration supports combined units", "[duration]") {
  CHECK(parse_duration("1h30m") == seconds{3600 + 30 * 60});
  CHECK(parse_duration("2h3m4s") == seconds{2 * 3600 + 3 * 60 + 4});
  CHECK(parse_duration("5m") == seconds{300});
  CHECK(parse_duration("90S") == seconds{90});
  CHECK(parse_duration("10") == seconds{10});
  CHECK(parse_duration(" 45s ") == seconds{45});
  CHECK(parse_duration("") == seconds{0});
}

TEST_CASE("parse_duration rejects invalid strings", "[duration]") {
  CHECK_THROWS_AS(parse_duration("1h30"), std::invalid_argument);
  CHECK_THROWS_AS(parse_duration("10m5"), std::invalid_argument);
  CHECK_THROWS_AS(parse_duration("abc"), std::invalid_argument);
  CHECK_THROWS_AS(parse_duration("1.5h"), std::invalid_argument);
  CHECK_THROWS_AS(parse_duration("-5m"), std::invalid_argument);
  CHECK_THROWS_AS(parse_duration("3d"), std::invalid_argument);
  CHECK_THROWS_AS(parse_duration("99999999999999999999h"),
                  std::invalid_argument);
}

TEST_CASE("format_duration prints compact units", "[duration]") {
  CHECK(format_duration(seconds{330}) == "5m30s");
  CHECK(format_duration(seconds{3600}) == "1h");
  CHECK(format_duration(seconds{3725}) == "1h2m5s");
  CHECK(format_duration(seconds{0}) == "0s");
}
