
#include "stdinc.hpp"

#include "conduit/rpc/wire-protocol.hpp"

#include <catch2/catch_all.hpp>

namespace conduit::rpc::tests {

namespace {
  struct TextTooLong : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  template <typename T> struct Tagged : std::logic_error {
    using std::logic_error::logic_error;
  };
} // namespace

template <typename E> static WireFault describe(E e) {
  return describe_exception(std::make_exception_ptr(std::move(e)));
}

CATCH_TEST_CASE("WireFault", "[wire-protocol]") {
  CATCH_SECTION("generic") {
    const auto fault = WireFault::generic();
    CATCH_REQUIRE(fault.cls == "RequestException");
    CATCH_REQUIRE(fault.args == ValueList{500});
    CATCH_REQUIRE(fault.to_value() == Value::parse(R"({"cls": "RequestException", "args": [500]})"));
  }

  CATCH_SECTION("from-value") {
    const auto fault = WireFault::from_value(Value::parse(R"({"cls": "Oops", "args": [1, "a"]})"));
    CATCH_REQUIRE(fault == WireFault{"Oops", {1, "a"}});

    for (const auto text : {R"("Oops")", R"({"cls": "Oops"})", R"({"args": []})",
                            R"({"cls": 1, "args": []})", R"({"cls": "Oops", "args": 1})"}) {
      try {
        WireFault::from_value(Value::parse(text));
        CATCH_FAIL(format("expected a ProtocolError for '{}'", text));
      } catch (const ProtocolError& e) {
        CATCH_REQUIRE(e.code() == ecode::invalid_response);
      }
    }
  }

  CATCH_SECTION("embed-and-extract") {
    Container response{{"result", "partial"}};
    CATCH_REQUIRE(!extract_fault(response).has_value());

    embed_fault(response, WireFault{"Oops", {1}});
    CATCH_REQUIRE(response.size() == 1);
    CATCH_REQUIRE(response.contains("__exception__"));
    CATCH_REQUIRE(extract_fault(response) == WireFault{"Oops", {1}});

    const auto bad = Container{{"__exception__", "Oops"}};
    CATCH_REQUIRE_THROWS_AS(extract_fault(bad), ProtocolError);
  }
}

CATCH_TEST_CASE("DescribeException", "[wire-protocol]") {
  CATCH_SECTION("faults") {
    CATCH_REQUIRE(describe(Fault{"Oops", {1, 2}}) == WireFault{"Oops", {1, 2}});
    CATCH_REQUIRE(describe(RequestException{ValueList{"down"}})
                  == WireFault{"RequestException", {"down"}});
  }

  CATCH_SECTION("standard-exceptions") {
    CATCH_REQUIRE(describe(std::invalid_argument{"a"}) == WireFault{"invalid_argument", {"a"}});
    CATCH_REQUIRE(describe(std::out_of_range{"b"}) == WireFault{"out_of_range", {"b"}});
    CATCH_REQUIRE(describe(std::logic_error{"c"}) == WireFault{"logic_error", {"c"}});
    CATCH_REQUIRE(describe(std::overflow_error{"d"}) == WireFault{"overflow_error", {"d"}});
    CATCH_REQUIRE(describe(std::runtime_error{"e"}) == WireFault{"runtime_error", {"e"}});
    CATCH_REQUIRE(describe(std::bad_alloc{}).cls == "bad_alloc");
    CATCH_REQUIRE(describe(42) == WireFault{"exception", {}});
  }

  CATCH_SECTION("conduit-errors") {
    CATCH_REQUIRE(describe(ValidationError{ecode::bad_description, "bad"}).cls == "ValidationError");
    CATCH_REQUIRE(describe(ProtocolError{ecode::invalid_data, "junk"}).cls == "ProtocolError");
    CATCH_REQUIRE(describe(StateError{ecode::registry_finalized, "late"}).cls == "StateError");
  }

  CATCH_SECTION("user-exceptions") {
    CATCH_REQUIRE(describe(TextTooLong{"long"}) == WireFault{"TextTooLong", {"long"}});
    CATCH_REQUIRE(describe(Tagged<int>{"t"}) == WireFault{"Tagged<int>", {"t"}});
  }
}

} // namespace conduit::rpc::tests
