
#include "stdinc.hpp"

#include "conduit/rpc/description.hpp"

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

CATCH_TEST_CASE("Names", "[description]") {
  CATCH_SECTION("valid-names") {
    for (const auto name : {"a", "Z", "upper", "getUser2", "a_b_c", "A1_", "x__"}) {
      CATCH_REQUIRE(is_valid_name(name));
      CATCH_REQUIRE_NOTHROW(validate_name(name));
    }
  }

  CATCH_SECTION("invalid-names") {
    for (const auto name : {"", "1abc", "_abc", "a/b", "a.b", "a-b", "a+b", "a b", " a", "a\n"}) {
      CATCH_REQUIRE(!is_valid_name(name));
      CATCH_REQUIRE(error_of([name]() { validate_name(name); }) == ecode::invalid_name);
    }
  }
}

CATCH_TEST_CASE("ApiConfig", "[description]") {
  CATCH_SECTION("defaults") {
    const auto config = ApiConfig::defaults();
    CATCH_REQUIRE(config.version == "0");
    CATCH_REQUIRE(config.timeout == std::chrono::milliseconds{2000});
    CATCH_REQUIRE(!config.debug);
    CATCH_REQUIRE(config.endpoint.scheme == "https");
    CATCH_REQUIRE(config.endpoint.host == "localhost");
    CATCH_REQUIRE(config.endpoint.port == 8080);
    CATCH_REQUIRE(config.endpoint.pattern == "/api/{operation}");
    CATCH_REQUIRE(config.operations.empty());
    CATCH_REQUIRE(config.exceptions.empty());
  }

  CATCH_SECTION("defaults-are-copies") {
    auto a = ApiConfig::defaults();
    a.endpoint.host = "example.com";
    a.endpoint.pattern = "/other/{operation}";
    const auto b = ApiConfig::defaults();
    CATCH_REQUIRE(b.endpoint.host == "localhost");
    CATCH_REQUIRE(b.endpoint.pattern == "/api/{operation}");

    const auto c = ApiConfig::from_description(Value::object());
    CATCH_REQUIRE(c.endpoint.host == "localhost");
  }

  CATCH_SECTION("from-description") {
    const auto config = ApiConfig::from_string(R"({
      "name": "text",
      "version": "2.0",
      "not_provided": "value",
      "timeout": 0.5,
      "debug": true,
      "endpoint": { "scheme": "http", "port": "9000", "tls": false },
      "exceptions": [ "TextTooLong" ],
      "operations": [
        { "name": "upper", "input": ["text"], "output": ["result"], "idempotent": true },
        "ping"
      ]
    })");

    CATCH_REQUIRE(config.name == "text");
    CATCH_REQUIRE(config.version == "2.0");
    CATCH_REQUIRE(config.timeout == std::chrono::milliseconds{500});
    CATCH_REQUIRE(config.debug);
    CATCH_REQUIRE(config.metadata["not_provided"] == "value");

    // Merged over the default endpoint
    CATCH_REQUIRE(config.endpoint.scheme == "http");
    CATCH_REQUIRE(config.endpoint.host == "localhost");
    CATCH_REQUIRE(config.endpoint.port == 9000);
    CATCH_REQUIRE(config.endpoint.pattern == "/api/{operation}");
    CATCH_REQUIRE(config.endpoint.metadata["tls"] == false);

    CATCH_REQUIRE(config.exceptions.count("TextTooLong") == 1);
    CATCH_REQUIRE(config.operations.size() == 2);

    const auto& upper = config.operations.at("upper");
    CATCH_REQUIRE(upper.input == std::vector<std::string>{"text"});
    CATCH_REQUIRE(upper.output == std::vector<std::string>{"result"});
    CATCH_REQUIRE(upper.metadata["idempotent"] == true);

    const auto& ping = config.operations.at("ping");
    CATCH_REQUIRE(ping.input.empty());
    CATCH_REQUIRE(ping.output.empty());
  }

  CATCH_SECTION("operations-as-object") {
    const auto config = ApiConfig::from_string(R"({
      "operations": { "upper": { "input": ["text"], "output": ["result"] }, "ping": {} }
    })");
    CATCH_REQUIRE(config.operations.size() == 2);
    CATCH_REQUIRE(config.operations.at("upper").name == "upper");
    CATCH_REQUIRE(config.operations.at("ping").input.empty());
  }

  CATCH_SECTION("bad-descriptions") {
    auto code_for = [](const char* text) {
      return error_of([text]() { ApiConfig::from_string(text); });
    };
    CATCH_REQUIRE(code_for("not json") == ecode::bad_description);
    CATCH_REQUIRE(code_for("[]") == ecode::bad_description);
    CATCH_REQUIRE(code_for(R"({"operations": ["1abc"]})") == ecode::invalid_name);
    CATCH_REQUIRE(code_for(R"({"operations": [{"name": "a", "input": ["x-y"]}]})")
                  == ecode::invalid_name);
    CATCH_REQUIRE(code_for(R"({"operations": [{"name": "a", "input": ["x", "x"]}]})")
                  == ecode::bad_description);
    CATCH_REQUIRE(code_for(R"({"operations": ["a", "a"]})") == ecode::bad_description);
    CATCH_REQUIRE(code_for(R"({"operations": [42]})") == ecode::bad_description);
    CATCH_REQUIRE(code_for(R"({"exceptions": ["Not.A.Name"]})") == ecode::invalid_name);
    CATCH_REQUIRE(code_for(R"({"timeout": "soon"})") == ecode::bad_description);
    CATCH_REQUIRE(code_for(R"({"timeout": -1})") == ecode::bad_description);
    CATCH_REQUIRE(code_for(R"({"debug": "yes"})") == ecode::bad_description);
    CATCH_REQUIRE(code_for(R"({"endpoint": {"port": 70000}})") == ecode::bad_endpoint);
    CATCH_REQUIRE(code_for(R"({"endpoint": {"port": "http"}})") == ecode::bad_endpoint);
  }
}

CATCH_TEST_CASE("Endpoint", "[description]") {
  CATCH_SECTION("client-format") {
    const auto endpoint = Endpoint{"scheme", "host", 8080, "/pattern"};
    CATCH_REQUIRE(make_client_format(endpoint) == "scheme://host:8080/pattern");
  }

  CATCH_SECTION("invalid-client-format") {
    auto code_for = [](Endpoint endpoint) {
      return error_of([&endpoint]() { make_client_format(endpoint); });
    };
    CATCH_REQUIRE(code_for(Endpoint{"scheme", "", 8080, "/pattern"}) == ecode::bad_endpoint);
    CATCH_REQUIRE(code_for(Endpoint{"", "host", 8080, "/pattern"}) == ecode::bad_endpoint);
    CATCH_REQUIRE(code_for(Endpoint{"scheme", "host", std::nullopt, "/pattern"})
                  == ecode::bad_endpoint);
    CATCH_REQUIRE(code_for(Endpoint{"scheme", "host", 8080, ""}) == ecode::bad_endpoint);
  }

  CATCH_SECTION("service-pattern") {
    const auto matcher = PathMatcher::make("/api/{operation}/suffix");
    const auto operation = matcher.match("/api/foo/suffix");
    CATCH_REQUIRE(operation.has_value());
    CATCH_REQUIRE(*operation == "foo");

    CATCH_REQUIRE(matcher.match("/api/foo/suffix/").value() == "foo");
    CATCH_REQUIRE(!matcher.match("/api/foo/bar/suffix"));
    CATCH_REQUIRE(!matcher.match("/api//suffix"));
    CATCH_REQUIRE(!matcher.match("/api/foo"));
    CATCH_REQUIRE(!matcher.match("/prefix/api/foo/suffix"));
    CATCH_REQUIRE(matcher.match("/nope").error() == ecode::unknown_operation);
  }

  CATCH_SECTION("service-pattern-escapes-literals") {
    const auto matcher = PathMatcher::make("/v1.0/{operation}");
    CATCH_REQUIRE(matcher.match("/v1.0/upper").value() == "upper");
    CATCH_REQUIRE(!matcher.match("/v1x0/upper"));
  }

  CATCH_SECTION("invalid-service-pattern") {
    CATCH_REQUIRE(error_of([]() { PathMatcher::make(""); }) == ecode::bad_endpoint);
    CATCH_REQUIRE(error_of([]() { PathMatcher::make("/api"); }) == ecode::bad_endpoint);
    CATCH_REQUIRE(error_of([]() { PathMatcher::make("/{operation}/{operation}"); })
                  == ecode::bad_endpoint);
  }
}

CATCH_TEST_CASE("Api", "[description]") {
  CATCH_SECTION("compiled-api") {
    auto config = ApiConfig::from_string(R"({
      "version": "2.0",
      "endpoint": { "scheme": "http", "host": "localhost", "port": 8080,
                    "pattern": "/api/{version}/{operation}" },
      "exceptions": [ "TextTooLong" ],
      "operations": [ "upper" ]
    })");
    const auto api = Api{config};

    CATCH_REQUIRE(api.client_format() == "http://localhost:8080/api/2.0/{operation}");
    CATCH_REQUIRE(api.format_uri("upper") == "http://localhost:8080/api/2.0/upper");
    CATCH_REQUIRE(api.matcher().match("/api/2.0/upper").value() == "upper");
    CATCH_REQUIRE(!api.matcher().match("/api/1.0/upper"));

    CATCH_REQUIRE(api.find_operation("upper") != nullptr);
    CATCH_REQUIRE(api.find_operation("lower") == nullptr);
    CATCH_REQUIRE(api.is_whitelisted("TextTooLong"));
    CATCH_REQUIRE(!api.is_whitelisted("RequestException"));

    // The api keeps its own copy
    config.endpoint.host = "example.com";
    CATCH_REQUIRE(api.config().endpoint.host == "localhost");
  }

  CATCH_SECTION("client-format-is-lazy-failure") {
    auto config = ApiConfig::defaults();
    config.endpoint.host.clear();
    const auto api = Api{config}; // A service needs no host
    CATCH_REQUIRE(api.matcher().match("/api/upper").value() == "upper");
    CATCH_REQUIRE(error_of([&api]() { api.client_format(); }) == ecode::bad_endpoint);
  }

  CATCH_SECTION("bad-pattern") {
    auto config = ApiConfig::defaults();
    config.endpoint.pattern = "/api";
    CATCH_REQUIRE(error_of([&config]() { Api{config}; }) == ecode::bad_endpoint);
  }

  CATCH_SECTION("hand-built-config-is-validated") {
    auto config = ApiConfig::defaults();
    config.operations["bad-name"] = OperationDescriptor{"bad-name", {}, {}};
    CATCH_REQUIRE(error_of([&config]() { Api{config}; }) == ecode::invalid_name);

    config = ApiConfig::defaults();
    config.operations["upper"] = OperationDescriptor{"lower", {}, {}};
    CATCH_REQUIRE(error_of([&config]() { Api{config}; }) == ecode::bad_description);
  }
}

} // namespace conduit::rpc::tests
