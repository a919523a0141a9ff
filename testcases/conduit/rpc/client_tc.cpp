
#include "stdinc.hpp"

#include "conduit/net/loopback-transport.hpp"
#include "conduit/rpc/client.hpp"
#include "conduit/rpc/service.hpp"
#include "conduit/utils/string-utils.hpp"

#include <catch2/catch_all.hpp>

namespace conduit::rpc::tests {

static constexpr const char* k_text_api = R"({
  "name": "text",
  "endpoint": { "scheme": "http", "host": "localhost", "port": 8080,
                "pattern": "/api/{operation}" },
  "exceptions": [ "TextTooLong" ],
  "operations": [
    { "name": "upper", "input": ["text"], "output": ["result"] },
    { "name": "split", "input": ["text"], "output": ["head", "tail"] },
    "ping"
  ]
})";

static ApiConfig text_config(bool debug = false) {
  auto config = ApiConfig::from_string(k_text_api);
  config.debug = debug;
  return config;
}

static std::error_code error_of(std::function<void()> thunk) {
  try {
    thunk();
  } catch (const std::system_error& e) {
    return e.code();
  }
  return {};
}

// A service and a client, connected in-process
struct TextApi {
  Service service;
  Client client;

  explicit TextApi(bool debug = false)
      : service{text_config(debug)},
        client{text_config(debug), std::make_shared<net::LoopbackTransport>(service)} {
    service.operation("upper", [](Container& request, Container& response, Context&) {
      const auto text = request["text"].get<std::string>();
      if (text.size() > 10)
        throw Fault{"TextTooLong", {text.size()}};
      if (text == "range")
        throw std::out_of_range{"no range here"};
      response.set("result", to_upper_copy(text));
    });
    service.operation("split", [](Container& request, Container& response, Context&) {
      const auto text = request["text"].get<std::string>();
      response.set("head", text.substr(0, 1));
      response.set("tail", text.empty() ? std::string{} : text.substr(1));
    });
    service.operation("ping", [](Container&, Container&, Context&) {});
  }
};

// Answers every post with the same result, and remembers the request
class FixedTransport final : public net::Transport {
private:
  tl::expected<net::HttpResponse, std::error_code> result_;

public:
  std::string last_uri;
  std::string last_body;

  explicit FixedTransport(tl::expected<net::HttpResponse, std::error_code> result)
      : result_{std::move(result)} {}

  tl::expected<net::HttpResponse, std::error_code> post(const std::string& uri,
                                                        const std::string& body,
                                                        std::chrono::milliseconds) override {
    last_uri = uri;
    last_body = body;
    return result_;
  }
};

CATCH_TEST_CASE("Client", "[client]") {
  CATCH_SECTION("round-trip") {
    TextApi api;
    CATCH_REQUIRE(api.client.call("upper", {"hi"}) == "HI");
    CATCH_REQUIRE(api.client.call("split", {"hello"}) == Value::array({"h", "ello"}));
    CATCH_REQUIRE(api.client.call("ping").is_null());

    const auto fields = api.client.call_fields("split", Container{{"text", "ab"}});
    CATCH_REQUIRE(fields == Container{{"head", "a"}, {"tail", "b"}});
  }

  CATCH_SECTION("bad-calls") {
    TextApi api;
    CATCH_REQUIRE(error_of([&]() { api.client.call("upper"); }) == ecode::argument_error);
    CATCH_REQUIRE(error_of([&]() { api.client.call("upper", {"a", "b"}); })
                  == ecode::argument_error);
    CATCH_REQUIRE(error_of([&]() { api.client.call("lower", {"a"}); })
                  == ecode::unknown_operation);
    CATCH_REQUIRE(error_of([&]() { api.client.call_fields("lower", {}); })
                  == ecode::unknown_operation);
  }

  CATCH_SECTION("missing-outputs-are-null") {
    TextApi api;
    api.service.plugin(Scope::OPERATION, [](Container& request, Container&, Context& context) {
      if (request["text"] != "")
        context.next();
    });
    CATCH_REQUIRE(api.client.call("upper", {""}).is_null());
    CATCH_REQUIRE(api.client.call("split", {""}) == Value::array({nullptr, nullptr}));
    CATCH_REQUIRE(api.client.call("upper", {"x"}) == "X");
  }

  CATCH_SECTION("redacted-fault") {
    TextApi api;
    api.service.plugin(Scope::OPERATION, [](Container& request, Container&, Context& context) {
      if (request["text"] == "")
        throw std::runtime_error{"empty text"};
      context.next();
    });
    try {
      api.client.call("upper", {""});
      CATCH_FAIL("expected a RequestException");
    } catch (const RequestException& e) {
      CATCH_REQUIRE(e.args() == ValueList{500});
      CATCH_REQUIRE(e.is(api.client.exceptions().get("RequestException")));
    }
  }

  CATCH_SECTION("whitelisted-fault") {
    TextApi api;
    try {
      api.client.call("upper", {"far too long"});
      CATCH_FAIL("expected a Fault");
    } catch (const RequestException&) {
      CATCH_FAIL("expected TextTooLong");
    } catch (const Fault& e) {
      CATCH_REQUIRE(e.name() == "TextTooLong");
      CATCH_REQUIRE(e.args() == ValueList{12});
      CATCH_REQUIRE(e.is(api.client.exceptions().get("TextTooLong")));
    }
  }

  CATCH_SECTION("builtin-fault-in-debug") {
    TextApi api{true};
    CATCH_REQUIRE_THROWS_AS(api.client.call("upper", {"range"}), std::out_of_range);
    CATCH_REQUIRE_THROWS_WITH(api.client.call("upper", {"range"}), "no range here");
  }

  CATCH_SECTION("plugins") {
    TextApi api;
    Value seen;
    api.client.plugin(Scope::OPERATION,
                      [&seen](Container& request, Container& response, Context& context) {
                        request.set("text", request["text"].get<std::string>() + "!");
                        context.next();
                        seen = response["result"];
                      });

    bool request_plugin_ran = false;
    api.client.plugin(Scope::REQUEST, [&request_plugin_ran](Context& context) {
      request_plugin_ran = true;
      CATCH_REQUIRE(context.operation() == "upper");
      context.next();
      CATCH_REQUIRE(!context.response_body().empty());
    });

    CATCH_REQUIRE(api.client.call("upper", {"hi"}) == "HI!");
    CATCH_REQUIRE(seen == "HI!");
    CATCH_REQUIRE(request_plugin_ran);
    CATCH_REQUIRE(error_of([&]() { api.client.plugin(Scope::REQUEST, [](Context&) {}); })
                  == ecode::registry_finalized);
  }

  CATCH_SECTION("construction") {
    auto config = text_config();
    auto transport = std::make_shared<FixedTransport>(net::make_response(200, "{}"));
    CATCH_REQUIRE(error_of([&]() { Client{config, nullptr}; }) == ecode::argument_error);

    config.endpoint.host.clear();
    CATCH_REQUIRE(error_of([&]() { Client{config, transport}; }) == ecode::bad_endpoint);
  }
}

CATCH_TEST_CASE("ClientTransportFailures", "[client]") {
  using unexpected_t = tl::unexpected<std::error_code>;
  const auto config = text_config();

  auto request_exception_args = [&config](std::shared_ptr<FixedTransport> transport) {
    Client client{config, transport};
    try {
      client.call("upper", {"hi"});
    } catch (const RequestException& e) {
      return e.args();
    }
    return ValueList{};
  };

  CATCH_SECTION("request") {
    auto transport = std::make_shared<FixedTransport>(net::make_response(200, R"({"result": "HI"})"));
    Client client{config, transport};
    CATCH_REQUIRE(client.call("upper", {"hi"}) == "HI");
    CATCH_REQUIRE(transport->last_uri == "http://localhost:8080/api/upper");
    CATCH_REQUIRE(Value::parse(transport->last_body) == Value::parse(R"({"text": "hi"})"));
  }

  CATCH_SECTION("http-status") {
    auto transport = std::make_shared<FixedTransport>(net::make_response(503));
    CATCH_REQUIRE(request_exception_args(transport) == ValueList{"503 Service Unavailable"});
  }

  CATCH_SECTION("connection-failure") {
    const auto ec = std::make_error_code(std::errc::connection_refused);
    auto transport = std::make_shared<FixedTransport>(unexpected_t{ec});
    CATCH_REQUIRE(request_exception_args(transport) == ValueList{ec.message()});
  }

  CATCH_SECTION("malformed-response") {
    Client client{config, std::make_shared<FixedTransport>(net::make_response(200, "<html>"))};
    try {
      client.call("upper", {"hi"});
      CATCH_FAIL("expected a ProtocolError");
    } catch (const ProtocolError& e) {
      CATCH_REQUIRE(e.code() == ecode::invalid_response);
    }
  }

  CATCH_SECTION("malformed-fault") {
    Client client{config, std::make_shared<FixedTransport>(
                              net::make_response(200, R"({"__exception__": "TextTooLong"})"))};
    try {
      client.call("upper", {"hi"});
      CATCH_FAIL("expected a ProtocolError");
    } catch (const ProtocolError& e) {
      CATCH_REQUIRE(e.code() == ecode::invalid_response);
    }
  }
}

} // namespace conduit::rpc::tests
