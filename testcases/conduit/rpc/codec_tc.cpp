
#include "stdinc.hpp"

#include "conduit/rpc/codec.hpp"
#include "conduit/rpc/errors.hpp"

#include <catch2/catch_all.hpp>

namespace conduit::rpc::tests {

CATCH_TEST_CASE("JsonCodec", "[codec]") {
  const auto codec = make_json_codec();

  CATCH_SECTION("serialize") {
    const auto text = codec->serialize(Container{{"text", "hi"}, {"n", 2}});
    CATCH_REQUIRE(Value::parse(text) == Value::parse(R"({"text": "hi", "n": 2})"));
    CATCH_REQUIRE(codec->serialize(Container{}) == "{}");
    CATCH_REQUIRE(codec->content_type() == "application/json");
  }

  CATCH_SECTION("deserialize-replaces-contents") {
    Container c{{"stale", 1}};
    codec->deserialize(R"({"text": "hi", "list": [1, 2], "none": null})", c);
    CATCH_REQUIRE(c.size() == 3);
    CATCH_REQUIRE(!c.contains("stale"));
    CATCH_REQUIRE(c["text"] == "hi");
    CATCH_REQUIRE(c["list"] == Value::array({1, 2}));
    CATCH_REQUIRE(c.contains("none"));
  }

  CATCH_SECTION("malformed-payloads") {
    for (const auto text : {"", "{", "not json", "[1, 2]", "\"text\"", "42"}) {
      Container c{{"kept", true}};
      try {
        codec->deserialize(text, c);
        CATCH_FAIL(format("expected a ProtocolError for '{}'", text));
      } catch (const ProtocolError& e) {
        CATCH_REQUIRE(e.code() == ecode::invalid_data);
      }
      CATCH_REQUIRE(c == Container{{"kept", true}});
    }
  }
}

} // namespace conduit::rpc::tests
