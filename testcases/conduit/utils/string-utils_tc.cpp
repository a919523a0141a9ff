
#include "stdinc.hpp"

#include "conduit/utils/string-utils.hpp"

#include <catch2/catch_all.hpp>

namespace conduit::tests {

CATCH_TEST_CASE("StrUtils", "[str-utils]") {
  CATCH_SECTION("replace-all") {
    string s = "/api/{version}/{operation}/{version}";
    CATCH_REQUIRE(replace_all(s, "{version}", "2.0") == 2);
    CATCH_REQUIRE(s == "/api/2.0/{operation}/2.0");
    CATCH_REQUIRE(replace_all(s, "{missing}", "x") == 0);
    CATCH_REQUIRE(replace_all(s, "", "x") == 0);

    string t = "aaa";
    CATCH_REQUIRE(replace_all(t, "a", "aa") == 3);
    CATCH_REQUIRE(t == "aaaaaa");
  }

  CATCH_SECTION("count-occurrences") {
    CATCH_REQUIRE(count_occurrences("/{operation}/{operation}", "{operation}") == 2);
    CATCH_REQUIRE(count_occurrences("/api", "{operation}") == 0);
    CATCH_REQUIRE(count_occurrences("aaaa", "aa") == 2);
  }

  CATCH_SECTION("upper-lower") {
    CATCH_REQUIRE(to_upper_copy(string{"hi there"}) == "HI THERE");
    CATCH_REQUIRE(to_lower_copy(string{"HI There"}) == "hi there");
    CATCH_REQUIRE(to_upper_copy(string{}) == "");
  }

  CATCH_SECTION("trim") {
    string s = "  \t text \n";
    CATCH_REQUIRE(trim_copy(s) == "text");
    CATCH_REQUIRE(ltrim(s) == "text \n");
    CATCH_REQUIRE(rtrim(s) == "text");
  }
}
} // namespace conduit::tests
