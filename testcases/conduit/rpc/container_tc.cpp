
#include "stdinc.hpp"

#include "conduit/rpc/container.hpp"

#include <catch2/catch_all.hpp>

namespace conduit::rpc::tests {

CATCH_TEST_CASE("Container", "[container]") {
  CATCH_SECTION("missing-field-is-null") {
    Container c;
    CATCH_REQUIRE(c.get("missing").is_null());
    CATCH_REQUIRE(c["missing"].is_null());
    CATCH_REQUIRE(c.empty());
    CATCH_REQUIRE(!c.contains("missing"));
  }

  CATCH_SECTION("indexed-and-named-share-storage") {
    Container c;
    c.set("text", "hi");
    CATCH_REQUIRE(c["text"] == "hi");
    CATCH_REQUIRE(c.get("text") == "hi");
    c.set("text", 42);
    CATCH_REQUIRE(c["text"] == 42);
    CATCH_REQUIRE(c.size() == 1);
  }

  CATCH_SECTION("set-returns-stored-value") {
    Container c;
    auto& list = c.set("list", Value::array());
    list.push_back(1);
    list.push_back(2);
    CATCH_REQUIRE(c["list"] == Value::array({1, 2}));
  }

  CATCH_SECTION("erase-clear-update") {
    Container c{{"a", 1}, {"b", 2}};
    CATCH_REQUIRE(c.erase("a") == 1);
    CATCH_REQUIRE(c.erase("a") == 0);
    CATCH_REQUIRE(c.size() == 1);

    c.update(Container{{"b", 20}, {"c", 30}});
    CATCH_REQUIRE(c["b"] == 20);
    CATCH_REQUIRE(c["c"] == 30);

    c.clear();
    CATCH_REQUIRE(c.empty());
  }

  CATCH_SECTION("to-value") {
    Container c{{"name", "echo"}, {"n", 3}};
    CATCH_REQUIRE(c.to_value() == Value::parse(R"({"name": "echo", "n": 3})"));
    CATCH_REQUIRE(Container{}.to_value() == Value::object());
  }
}

} // namespace conduit::rpc::tests
