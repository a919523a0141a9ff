
#include "stdinc.hpp"

#include "conduit/utils/cli-utils.hpp"

#include <catch2/catch_all.hpp>

namespace conduit::cli::tests {
CATCH_TEST_CASE("CliUtils", "[cli-utils]") {
  std::vector<std::string> args = {"exec-name", "1", "two", "8080", "70000", "-3"};
  std::vector<char*> argv_s;
  int argc = int(args.size());
  for (auto i = 0; i < argc; ++i)
    argv_s.push_back(args[i].data());
  char** argv = argv_s.data();

  CATCH_SECTION("cli-utils") {
    int i = 0;
    CATCH_REQUIRE(safe_arg_int(argc, argv, i) == 1);
    CATCH_REQUIRE(i == 1);
    CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "two");
    CATCH_REQUIRE(i == 2);
    CATCH_REQUIRE(safe_arg_port(argc, argv, i) == 8080);
    CATCH_REQUIRE(i == 3);
    CATCH_REQUIRE_THROWS_AS(safe_arg_port(argc, argv, i), std::runtime_error);
    CATCH_REQUIRE(i == 4);
    i = 5;
    CATCH_REQUIRE_THROWS_AS(safe_arg_str(argc, argv, i), std::runtime_error);
  }

  CATCH_SECTION("cli-utils-bad-int") {
    int i = 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_int(argc, argv, i), std::runtime_error);
    CATCH_REQUIRE(i == 2);
    i = 4;
    CATCH_REQUIRE(safe_arg_int(argc, argv, i) == -3);
  }
}
} // namespace conduit::cli::tests
