
#include "stdinc.hpp"

#include "conduit/rpc/errors.hpp"
#include "conduit/rpc/processor.hpp"

#include <catch2/catch_all.hpp>

namespace conduit::rpc::tests {

using Log = std::vector<std::string>;

// Records every scope transition, and every execute(), into a shared log
class TestProcessor final : public Processor {
private:
  Log& log_;

protected:
  void execute() override {
    ++n_executed;
    log_.push_back("execute");
    if (on_execute)
      on_execute(context_);
  }

  void enter_scope(Scope scope) override { log_.push_back(format("enter:{}", str(scope))); }
  void exit_scope(Scope scope) override { log_.push_back(format("exit:{}", str(scope))); }

public:
  int n_executed = 0;
  std::function<void(Context&)> on_execute;

  TestProcessor(const PluginRegistry& plugins, const OperationDescriptor& descriptor, Log& log)
      : Processor{plugins, descriptor}, log_{log} {}
};

static RequestPlugin logging_plugin(Log& log, std::string name) {
  return [&log, name](Context& context) {
    log.push_back(name + ":before");
    context.next();
    log.push_back(name + ":after");
  };
}

static std::error_code error_of(std::function<void()> thunk) {
  try {
    thunk();
  } catch (const std::system_error& e) {
    return e.code();
  }
  return {};
}

CATCH_TEST_CASE("Processor", "[processor]") {
  const auto descriptor = OperationDescriptor{"upper", {"text"}, {"result"}};
  PluginRegistry plugins;
  Log log;

  CATCH_SECTION("scope-order-without-plugins") {
    TestProcessor processor{plugins, descriptor, log};
    CATCH_REQUIRE(processor.state() == Scope::REQUEST);
    processor.process();
    CATCH_REQUIRE(processor.state() == Scope::DONE);
    CATCH_REQUIRE(processor.n_executed == 1);
    CATCH_REQUIRE(log
                  == Log{"enter:request", "enter:operation", "enter:function", "execute",
                         "exit:function", "exit:operation", "exit:request"});
  }

  CATCH_SECTION("single-use") {
    TestProcessor processor{plugins, descriptor, log};
    processor.process();
    CATCH_REQUIRE(error_of([&]() { processor.process(); }) == ecode::already_processed);
    CATCH_REQUIRE(processor.n_executed == 1);
  }

  CATCH_SECTION("plugins-nest-in-registration-order") {
    plugins.add(Scope::REQUEST, logging_plugin(log, "P1"));
    plugins.add(Scope::REQUEST, logging_plugin(log, "P2"));
    plugins.add(Scope::OPERATION, [&log](Container&, Container&, Context& context) {
      log.push_back("O1:before");
      context.next();
      log.push_back("O1:after");
    });
    plugins.finalize();

    TestProcessor processor{plugins, descriptor, log};
    processor.process();
    CATCH_REQUIRE(log
                  == Log{"enter:request",
                         "P1:before",
                         "P2:before",
                         "enter:operation",
                         "O1:before",
                         "enter:function",
                         "execute",
                         "exit:function",
                         "O1:after",
                         "exit:operation",
                         "P2:after",
                         "P1:after",
                         "exit:request"});
  }

  CATCH_SECTION("short-circuit") {
    plugins.add(Scope::REQUEST, [&log](Context&) { log.push_back("P1"); });
    plugins.add(Scope::REQUEST, logging_plugin(log, "P2"));

    TestProcessor processor{plugins, descriptor, log};
    processor.process();
    CATCH_REQUIRE(processor.n_executed == 0);
    CATCH_REQUIRE(processor.state() == Scope::DONE);
    CATCH_REQUIRE(log == Log{"enter:request", "P1", "exit:request"});
  }

  CATCH_SECTION("next-twice") {
    plugins.add(Scope::REQUEST, [](Context& context) {
      context.next();
      context.next();
    });

    TestProcessor processor{plugins, descriptor, log};
    CATCH_REQUIRE(error_of([&]() { processor.process(); }) == ecode::continuation_reused);
    CATCH_REQUIRE(processor.n_executed == 1);
    CATCH_REQUIRE(processor.state() == Scope::DONE);
  }

  CATCH_SECTION("next-from-handler") {
    TestProcessor processor{plugins, descriptor, log};
    processor.on_execute = [](Context& context) { context.next(); };
    CATCH_REQUIRE(error_of([&]() { processor.process(); }) == ecode::continuation_reused);
    CATCH_REQUIRE(processor.n_executed == 1);
  }

  CATCH_SECTION("plugin-throws") {
    plugins.add(Scope::REQUEST, [](Context&) { throw std::runtime_error{"plugin failed"}; });

    TestProcessor processor{plugins, descriptor, log};
    CATCH_REQUIRE_THROWS_AS(processor.process(), std::runtime_error);
    CATCH_REQUIRE(processor.state() == Scope::DONE);
    CATCH_REQUIRE(processor.n_executed == 0);
  }

  CATCH_SECTION("context") {
    plugins.add(Scope::REQUEST, [](Context& context) {
      CATCH_REQUIRE(context.operation() == "upper");
      CATCH_REQUIRE(context.descriptor().input == std::vector<std::string>{"text"});
      context.values().set("seen", true);
      context.next();
    });

    TestProcessor processor{plugins, descriptor, log};
    processor.on_execute = [](Context& context) {
      CATCH_REQUIRE(context.values()["seen"] == true);
    };
    processor.process();
    CATCH_REQUIRE(processor.context().values()["seen"] == true);
  }
}

} // namespace conduit::rpc::tests
