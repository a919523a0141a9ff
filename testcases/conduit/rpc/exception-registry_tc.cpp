
#include "stdinc.hpp"

#include "conduit/rpc/exception-registry.hpp"

#include <catch2/catch_all.hpp>

namespace conduit::rpc::tests {

CATCH_TEST_CASE("ExceptionRegistry", "[exception-registry]") {
  CATCH_SECTION("identical-type-per-name") {
    ExceptionRegistry registry;
    const auto a = registry.get("InsufficientFunds");
    const auto b = registry.get("InsufficientFunds");
    CATCH_REQUIRE(a == b);
    CATCH_REQUIRE(a->name() == "InsufficientFunds");
    CATCH_REQUIRE(!a->is_builtin());
    CATCH_REQUIRE(registry.get("Other") != a);
    CATCH_REQUIRE(registry.size() == 2);
  }

  CATCH_SECTION("registries-are-independent") {
    ExceptionRegistry a, b;
    CATCH_REQUIRE(a.get("InsufficientFunds") != b.get("InsufficientFunds"));
    CATCH_REQUIRE(a.get("InsufficientFunds")->name() == b.get("InsufficientFunds")->name());
  }

  CATCH_SECTION("builtins-are-shared") {
    ExceptionRegistry a, b;
    for (const auto name : {"RequestException", "invalid_argument", "out_of_range"}) {
      CATCH_REQUIRE(ExceptionRegistry::is_builtin(name));
      CATCH_REQUIRE(a.get(name) == b.get(name));
      CATCH_REQUIRE(a.get(name)->is_builtin());
    }
    CATCH_REQUIRE(!ExceptionRegistry::is_builtin("InsufficientFunds"));
    CATCH_REQUIRE(a.size() == 0);
  }

  CATCH_SECTION("raise-user-fault") {
    ExceptionRegistry registry;
    const auto type = registry.get("InsufficientFunds");
    try {
      registry.raise("InsufficientFunds", {10, 25});
    } catch (const Fault& e) {
      CATCH_REQUIRE(e.is(type));
      CATCH_REQUIRE(e.name() == "InsufficientFunds");
      CATCH_REQUIRE(e.args() == ValueList{10, 25});
      CATCH_REQUIRE(std::string{e.what()} == "InsufficientFunds(10, 25)");
    }

    // Identity does not carry across registries
    ExceptionRegistry other;
    try {
      other.raise("InsufficientFunds", {});
    } catch (const Fault& e) {
      CATCH_REQUIRE(!e.is(type));
      CATCH_REQUIRE(e.is(other.get("InsufficientFunds")));
    }
  }

  CATCH_SECTION("raise-builtins") {
    ExceptionRegistry registry;
    CATCH_REQUIRE_THROWS_AS(registry.raise("invalid_argument", {"bad"}), std::invalid_argument);
    CATCH_REQUIRE_THROWS_AS(registry.raise("out_of_range", {"far"}), std::out_of_range);
    CATCH_REQUIRE_THROWS_AS(registry.raise("overflow_error", {}), std::overflow_error);
    CATCH_REQUIRE_THROWS_WITH(registry.raise("runtime_error", {"oops"}), "oops");
    CATCH_REQUIRE_THROWS_WITH(registry.raise("domain_error", {42}), "42");

    try {
      registry.raise("RequestException", {500});
    } catch (const RequestException& e) {
      CATCH_REQUIRE(e.is(registry.get("RequestException")));
      CATCH_REQUIRE(e.args() == ValueList{500});
    }
  }

  CATCH_SECTION("direct-faults-have-no-type") {
    const auto fault = Fault{"Direct", {"x"}};
    CATCH_REQUIRE(fault.type() == nullptr);
    CATCH_REQUIRE(std::string{fault.what()} == R"(Direct("x"))");
    CATCH_REQUIRE(RequestException{ValueList{500}}.name() == "RequestException");
  }
}

} // namespace conduit::rpc::tests
