
#include "stdinc.hpp"

#include "conduit/rpc/service.hpp"
#include "conduit/utils/string-utils.hpp"

#include <catch2/catch_all.hpp>

#include <atomic>
#include <thread>
#include <vector>

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

static constexpr std::size_t k_max_text_length = 10;

namespace {
  struct TextTooLong : std::runtime_error {
    using std::runtime_error::runtime_error;
  };
} // namespace

static ApiConfig text_config(bool debug = false) {
  auto config = ApiConfig::from_string(k_text_api);
  config.debug = debug;
  return config;
}

static void bind_text_api(Service& service) {
  service.operation("upper", [](Container& request, Container& response, Context&) {
    const auto text = request["text"].get<std::string>();
    response.set("result", to_upper_copy(text));
    if (text.size() > k_max_text_length)
      throw Fault{"TextTooLong", {text.size()}};
  });
  service.operation("split", [](Container& request, Container& response, Context&) {
    const auto text = request["text"].get<std::string>();
    response.set("head", text.substr(0, 1));
    response.set("tail", text.empty() ? std::string{} : text.substr(1));
  });
  service.operation("ping", [](Container&, Container&, Context&) {});
}

static std::error_code error_of(std::function<void()> thunk) {
  try {
    thunk();
  } catch (const std::system_error& e) {
    return e.code();
  }
  return {};
}

static bool same_json(const std::string& body, const char* expected) {
  return Value::parse(body) == Value::parse(expected);
}

static constexpr const char* k_redacted = R"({"__exception__": {"cls": "RequestException", "args": [500]}})";

CATCH_TEST_CASE("Service", "[service]") {
  CATCH_SECTION("dispatch") {
    Service service{text_config()};
    bind_text_api(service);
    service.validate();

    CATCH_REQUIRE(same_json(service.dispatch("upper", R"({"text": "hi"})"), R"({"result": "HI"})"));
    CATCH_REQUIRE(same_json(service.dispatch("split", R"({"text": "hello"})"),
                            R"({"head": "h", "tail": "ello"})"));
    CATCH_REQUIRE(service.dispatch("ping", "{}") == "{}");
    CATCH_REQUIRE(error_of([&]() { service.dispatch("lower", "{}"); })
                  == ecode::unknown_operation);
  }

  CATCH_SECTION("unlisted-faults-are-redacted") {
    Service service{text_config()};
    service.operation("upper", [](Container&, Container&, Context&) {
      throw std::runtime_error{"database password is hunter2"};
    });

    const auto body = service.dispatch("upper", R"({"text": "hi"})");
    CATCH_REQUIRE(same_json(body, k_redacted));
    CATCH_REQUIRE(body.find("hunter2") == std::string::npos);
  }

  CATCH_SECTION("debug-sends-every-fault") {
    Service service{text_config(true)};
    service.operation("upper", [](Container&, Container&, Context&) {
      throw std::runtime_error{"details"};
    });
    CATCH_REQUIRE(same_json(service.dispatch("upper", R"({"text": "hi"})"),
                            R"({"__exception__": {"cls": "runtime_error", "args": ["details"]}})"));
  }

  CATCH_SECTION("whitelisted-fault-replaces-partial-response") {
    Service service{text_config()};
    bind_text_api(service);
    const auto body = service.dispatch("upper", R"({"text": "far too long"})");
    CATCH_REQUIRE(same_json(body, R"({"__exception__": {"cls": "TextTooLong", "args": [12]}})"));
  }

  CATCH_SECTION("whitelisted-exception-class") {
    Service service{text_config()};
    service.operation("upper", [](Container&, Container&, Context&) {
      throw TextTooLong{"long"};
    });
    service.operation("split", [](Container&, Container&, Context&) {
      throw std::runtime_error{"long"};
    });
    CATCH_REQUIRE(same_json(service.dispatch("upper", R"({"text": "hi"})"),
                            R"({"__exception__": {"cls": "TextTooLong", "args": ["long"]}})"));
    CATCH_REQUIRE(same_json(service.dispatch("split", R"({"text": "hi"})"), k_redacted));
  }

  CATCH_SECTION("fault-after-serialization") {
    Service service{text_config()};
    bind_text_api(service);
    service.plugin(Scope::REQUEST, [](Context& context) {
      context.next();
      throw Fault{"TextTooLong", {0}};
    });
    CATCH_REQUIRE(same_json(service.dispatch("upper", R"({"text": "hi"})"),
                            R"({"__exception__": {"cls": "TextTooLong", "args": [0]}})"));
  }

  CATCH_SECTION("malformed-request") {
    Service service{text_config()};
    bind_text_api(service);
    CATCH_REQUIRE(same_json(service.dispatch("upper", "not json"), k_redacted));
  }

  CATCH_SECTION("missing-handler") {
    Service service{text_config()};
    CATCH_REQUIRE(same_json(service.dispatch("ping", "{}"), k_redacted));

    Service debug_service{text_config(true)};
    const auto response = Value::parse(debug_service.dispatch("ping", "{}"));
    CATCH_REQUIRE(response["__exception__"]["cls"] == "ValidationError");
  }

  CATCH_SECTION("binding-errors") {
    Service service{text_config()};
    const Handler noop = [](Container&, Container&, Context&) {};

    CATCH_REQUIRE(error_of([&]() { service.validate(); }) == ecode::missing_handler);
    CATCH_REQUIRE(error_of([&]() { service.operation("lower", noop); })
                  == ecode::unknown_operation);
    CATCH_REQUIRE(error_of([&]() { service.operation("upper", Handler{}); })
                  == ecode::argument_error);

    service.operation("upper", noop);
    CATCH_REQUIRE(error_of([&]() { service.operation("upper", noop); }) == ecode::already_bound);

    service.operation("split", noop);
    service.operation("ping", noop);
    CATCH_REQUIRE_NOTHROW(service.validate());
  }

  CATCH_SECTION("registration-closes-on-first-call") {
    Service service{text_config()};
    bind_text_api(service);
    service.dispatch("ping", "{}");

    bool late_plugin_ran = false;
    auto late_plugin = [&late_plugin_ran](Context& context) {
      late_plugin_ran = true;
      context.next();
    };
    CATCH_REQUIRE(error_of([&]() { service.plugin(Scope::REQUEST, late_plugin); })
                  == ecode::registry_finalized);
    CATCH_REQUIRE(error_of([&]() {
                    service.operation("ping", [](Container&, Container&, Context&) {});
                  })
                  == ecode::registry_finalized);

    service.dispatch("ping", "{}");
    CATCH_REQUIRE(!late_plugin_ran);
  }

  CATCH_SECTION("binding-races-first-call") {
    Service service{text_config()};
    service.operation("upper", [](Container& request, Container& response, Context&) {
      response.set("result", to_upper_copy(request["text"].get<std::string>()));
    });

    std::atomic<int> good_responses{0};
    std::vector<std::thread> callers;
    for (auto i = 0; i < 4; ++i)
      callers.emplace_back([&service, &good_responses]() {
        for (auto j = 0; j < 50; ++j)
          if (same_json(service.dispatch("upper", R"({"text": "hi"})"), R"({"result": "HI"})"))
            ++good_responses;
      });

    const auto bound = error_of([&]() {
      service.operation("ping", [](Container&, Container&, Context&) {});
    });
    for (auto& caller : callers)
      caller.join();

    CATCH_REQUIRE((!bound || bound == ecode::registry_finalized));
    CATCH_REQUIRE(good_responses == 200);
    CATCH_REQUIRE(error_of([&]() {
                    service.operation("split", [](Container&, Container&, Context&) {});
                  })
                  == ecode::registry_finalized);
  }

  CATCH_SECTION("plugins") {
    Service service{text_config()};
    bind_text_api(service);

    std::string seen_body;
    service.plugin(Scope::REQUEST, [&seen_body](Context& context) {
      CATCH_REQUIRE(context.response_body().empty());
      context.next();
      seen_body = context.response_body();
    });
    service.plugin(Scope::OPERATION, [](Container& request, Container& response, Context& context) {
      request.set("text", trim_copy(request["text"].get<std::string>()));
      context.next();
      response.set("trimmed", true);
    });

    const auto body = service.dispatch("upper", R"({"text": "  hi  "})");
    CATCH_REQUIRE(same_json(body, R"({"result": "HI", "trimmed": true})"));
    CATCH_REQUIRE(seen_body == body);
  }

  CATCH_SECTION("short-circuit") {
    Service service{text_config()};
    bind_text_api(service);
    service.plugin(Scope::OPERATION, [](Container& request, Container&, Context& context) {
      if (request["text"] != "")
        context.next();
    });
    CATCH_REQUIRE(service.dispatch("upper", R"({"text": ""})") == "{}");
    CATCH_REQUIRE(same_json(service.dispatch("upper", R"({"text": "a"})"), R"({"result": "A"})"));
  }

  CATCH_SECTION("handle-request") {
    Service service{text_config()};
    bind_text_api(service);

    const auto ok = service.handle_request("/api/upper", R"({"text": "hi"})");
    CATCH_REQUIRE(ok.status == 200);
    CATCH_REQUIRE(ok.ok());
    CATCH_REQUIRE(same_json(ok.body, R"({"result": "HI"})"));
    CATCH_REQUIRE(service.handle_request("/api/upper/", R"({"text": "hi"})").status == 200);

    CATCH_REQUIRE(service.handle_request("/api/lower", "{}").status == 404);
    CATCH_REQUIRE(service.handle_request("/other/upper", "{}").status == 404);
    CATCH_REQUIRE(service.handle_request("/api/upper/extra", "{}").status == 404);

    const auto big = std::string(Service::k_max_body_size + 1, ' ');
    const auto too_large = service.handle_request("/api/upper", big);
    CATCH_REQUIRE(too_large.status == 413);
    CATCH_REQUIRE(too_large.reason == "Payload Too Large");

    // Faults are still a 200
    CATCH_REQUIRE(service.handle_request("/api/upper", "not json").status == 200);
  }
}

} // namespace conduit::rpc::tests
