
#include "stdinc.hpp"

#include "conduit/net/asio-execution-context.hpp"
#include "conduit/net/http-server.hpp"
#include "conduit/net/http-transport.hpp"
#include "conduit/rpc/client.hpp"
#include "conduit/rpc/service.hpp"
#include "conduit/utils/string-utils.hpp"

#include <catch2/catch_all.hpp>

namespace conduit::tests {

static constexpr const char* k_text_api = R"({
  "name": "text",
  "endpoint": { "scheme": "http", "host": "127.0.0.1", "pattern": "/api/{operation}" },
  "exceptions": [ "TextTooLong" ],
  "operations": [ { "name": "upper", "input": ["text"], "output": ["result"] } ]
})";

// ----------------------------------------------------------------------------------------- parse-uri

CATCH_TEST_CASE("parse-uri", "[transport]") {
  CATCH_SECTION("parse-uri") {
    const auto uri = net::parse_uri("http://localhost:8080/api/upper?x=1");
    CATCH_REQUIRE(uri.has_value());
    CATCH_REQUIRE(uri->scheme == "http");
    CATCH_REQUIRE(uri->host == "localhost");
    CATCH_REQUIRE(uri->port == 8080);
    CATCH_REQUIRE(uri->target == "/api/upper?x=1");
  }

  CATCH_SECTION("default-ports") {
    CATCH_REQUIRE(net::parse_uri("http://example.com/a")->port == 80);
    CATCH_REQUIRE(net::parse_uri("https://example.com")->port == 443);
    CATCH_REQUIRE(net::parse_uri("https://example.com")->target == "/");
  }

  CATCH_SECTION("malformed") {
    for (const auto s : {"", "localhost:8080/api", "://host/", "http://", "http://:80/",
                         "http://host:port/", "http://host:99999/", "ftp://host/"}) {
      const auto uri = net::parse_uri(s);
      CATCH_REQUIRE(!uri.has_value());
      CATCH_REQUIRE(uri.error() == ecode::argument_error);
    }
  }

  CATCH_SECTION("reason-phrase") {
    CATCH_REQUIRE(net::make_response(404).reason == "Not Found");
    CATCH_REQUIRE(net::make_response(200, "{}").ok());
    CATCH_REQUIRE(!net::make_response(503).ok());
  }
}

// --------------------------------------------------------------------------------------- http-server

CATCH_TEST_CASE("http-server", "[http-server]") {
  using namespace std::chrono_literals;

  rpc::Service service{rpc::ApiConfig::from_string(k_text_api)};
  service.operation("upper", [](rpc::Container& request, rpc::Container& response, rpc::Context&) {
    const auto text = request["text"].get<std::string>();
    if (text.size() > 10)
      throw rpc::Fault{"TextTooLong", {text.size()}};
    response.set("result", to_upper_copy(text));
  });
  service.validate();

  net::AsioExecutionContext pool{2};

  net::HttpServer::Config server_config;
  server_config.address = "127.0.0.1";
  server_config.port = 0;
  server_config.handler = net::make_service_handler(service);

  net::HttpServer server{pool.io_context(), server_config};
  const auto ec = server.run();
  CATCH_REQUIRE(!ec);
  pool.run();

  const auto port = server.local_port();
  CATCH_REQUIRE(port != 0);

  CATCH_SECTION("round-trip") {
    auto config = rpc::ApiConfig::from_string(k_text_api);
    config.endpoint.port = port;
    rpc::Client client{config, std::make_shared<net::HttpTransport>()};

    CATCH_REQUIRE(client.call("upper", {"hi"}) == "HI");
    CATCH_REQUIRE(client.call("upper", {"again"}) == "AGAIN");
    CATCH_REQUIRE_THROWS_AS(client.call("upper", {"far too long"}), rpc::Fault);
  }

  CATCH_SECTION("raw-posts") {
    net::HttpTransport transport;
    const auto base = format("http://127.0.0.1:{}", port);

    const auto ok = transport.post(base + "/api/upper?trace=1", R"({"text": "hi"})", 2000ms);
    CATCH_REQUIRE(ok.has_value());
    CATCH_REQUIRE(ok->status == 200);
    CATCH_REQUIRE(rpc::Value::parse(ok->body) == rpc::Value::parse(R"({"result": "HI"})"));

    const auto not_found = transport.post(base + "/api/lower", "{}", 2000ms);
    CATCH_REQUIRE(not_found.has_value());
    CATCH_REQUIRE(not_found->status == 404);
    CATCH_REQUIRE(not_found->reason == "Not Found");

    const auto bad_scheme = transport.post(format("ws://127.0.0.1:{}/api/upper", port), "{}", 2000ms);
    CATCH_REQUIRE(!bad_scheme.has_value());
  }

  server.shutdown();
  pool.stop();
  pool.join();
}

} // namespace conduit::tests
