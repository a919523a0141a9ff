
#include "stdinc.hpp"

#include "conduit/rpc/errors.hpp"
#include "conduit/rpc/plugin-registry.hpp"

#include <catch2/catch_all.hpp>

namespace conduit::rpc::tests {

static std::error_code error_of(std::function<void()> thunk) {
  try {
    thunk();
  } catch (const std::system_error& e) {
    return e.code();
  }
  return {};
}

CATCH_TEST_CASE("PluginRegistry", "[plugin-registry]") {
  const RequestPlugin request_plugin = [](Context&) {};
  const OperationPlugin operation_plugin = [](Container&, Container&, Context&) {};

  CATCH_SECTION("add-by-scope") {
    PluginRegistry registry;
    registry.add(Scope::REQUEST, request_plugin);
    registry.add(Scope::REQUEST, request_plugin);
    registry.add(Scope::OPERATION, operation_plugin);
    CATCH_REQUIRE(registry.size(Scope::REQUEST) == 2);
    CATCH_REQUIRE(registry.size(Scope::OPERATION) == 1);
    CATCH_REQUIRE(registry.size(Scope::FUNCTION) == 0);
    CATCH_REQUIRE(registry.size(Scope::DONE) == 0);
  }

  CATCH_SECTION("invalid-scope") {
    PluginRegistry registry;
    auto code_for = [&registry](Scope scope, Plugin plugin) {
      return error_of([&]() { registry.add(scope, std::move(plugin)); });
    };
    CATCH_REQUIRE(code_for(Scope::FUNCTION, request_plugin) == ecode::invalid_scope);
    CATCH_REQUIRE(code_for(Scope::DONE, operation_plugin) == ecode::invalid_scope);
    CATCH_REQUIRE(code_for(Scope::REQUEST, operation_plugin) == ecode::invalid_scope);
    CATCH_REQUIRE(code_for(Scope::OPERATION, request_plugin) == ecode::invalid_scope);
    CATCH_REQUIRE(registry.size(Scope::REQUEST) == 0);
    CATCH_REQUIRE(registry.size(Scope::OPERATION) == 0);
  }

  CATCH_SECTION("finalize") {
    PluginRegistry registry;
    registry.add(Scope::REQUEST, request_plugin);
    CATCH_REQUIRE(!registry.is_finalized());

    registry.finalize();
    registry.finalize();
    CATCH_REQUIRE(registry.is_finalized());

    CATCH_REQUIRE(error_of([&]() { registry.add(Scope::REQUEST, request_plugin); })
                  == ecode::registry_finalized);
    CATCH_REQUIRE(registry.size(Scope::REQUEST) == 1);
  }

  CATCH_SECTION("scope-names") {
    CATCH_REQUIRE(str(Scope::REQUEST) == "request");
    CATCH_REQUIRE(str(Scope::OPERATION) == "operation");
    CATCH_REQUIRE(str(Scope::FUNCTION) == "function");
    CATCH_REQUIRE(str(Scope::DONE) == "done");
  }
}

} // namespace conduit::rpc::tests
