
#include "stdinc.hpp"

#include <catch2/catch_all.hpp>

namespace conduit::tests {

CATCH_TEST_CASE("Logging", "[logging]") {
  using logging::LogLevel;

  CATCH_SECTION("parse-log-level") {
    auto level = LogLevel::WARN;
    CATCH_REQUIRE(logging::parse_log_level("info", level));
    CATCH_REQUIRE(level == LogLevel::INFO);
    CATCH_REQUIRE(logging::parse_log_level(" TRACE ", level));
    CATCH_REQUIRE(level == LogLevel::TRACE);
    CATCH_REQUIRE(logging::parse_log_level("Error", level));
    CATCH_REQUIRE(level == LogLevel::ERROR);
  }

  CATCH_SECTION("unknown-log-level") {
    auto level = LogLevel::WARN;
    CATCH_REQUIRE(!logging::parse_log_level("loud", level));
    CATCH_REQUIRE(!logging::parse_log_level("", level));
    CATCH_REQUIRE(level == LogLevel::WARN);
  }
}

} // namespace conduit::tests
