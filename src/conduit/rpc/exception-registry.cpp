
#include "stdinc.hpp"

#include "exception-registry.hpp"

#include <stdexcept>

namespace conduit::rpc {

namespace {

  /// @private
  std::string message_from_args(const ValueList& args) {
    if (args.empty())
      return {};
    if (args.front().is_string())
      return args.front().get<std::string>();
    return args.front().dump(-1, ' ', false, Value::error_handler_t::replace);
  }

  /// @private
  template <typename E> FaultType::ThrowerType std_thrower() {
    return [](std::shared_ptr<const FaultType>, ValueList args) {
      throw E{message_from_args(args)};
    };
  }

  /// @private
  using BuiltinMap = std::map<std::string, FaultTypePtr, std::less<>>;

  /// @private
  const BuiltinMap& builtin_types() {
    static const BuiltinMap builtins = []() {
      BuiltinMap out;
      auto add = [&out](std::string name, FaultType::ThrowerType thrower) {
        auto type = std::make_shared<FaultType>(name, true, std::move(thrower));
        out.emplace(std::move(name), std::move(type));
      };

      add(RequestException::k_name, [](std::shared_ptr<const FaultType> type, ValueList args) {
        throw RequestException{std::move(type), std::move(args)};
      });
      add("runtime_error", std_thrower<std::runtime_error>());
      add("range_error", std_thrower<std::range_error>());
      add("overflow_error", std_thrower<std::overflow_error>());
      add("underflow_error", std_thrower<std::underflow_error>());
      add("logic_error", std_thrower<std::logic_error>());
      add("invalid_argument", std_thrower<std::invalid_argument>());
      add("domain_error", std_thrower<std::domain_error>());
      add("length_error", std_thrower<std::length_error>());
      add("out_of_range", std_thrower<std::out_of_range>());
      return out;
    }();
    return builtins;
  }

} // namespace

// --------------------------------------------------------------------------------------- FaultType

void FaultType::raise(ValueList args) const {
  if (thrower_)
    thrower_(shared_from_this(), args);
  throw Fault{shared_from_this(), std::move(args)};
}

// ------------------------------------------------------------------------------- ExceptionRegistry

bool ExceptionRegistry::is_builtin(std::string_view name) {
  const auto& builtins = builtin_types();
  return builtins.find(name) != builtins.end();
}

FaultTypePtr ExceptionRegistry::get(std::string_view name) const {
  const auto& builtins = builtin_types();
  if (const auto ii = builtins.find(name); ii != builtins.end())
    return ii->second;

  std::lock_guard lock{padlock_};
  if (const auto ii = types_.find(name); ii != types_.end())
    return ii->second;

  TRACE("creating fault type '{}'", name);
  auto type = std::make_shared<FaultType>(std::string{name}, false, nullptr);
  types_.emplace(std::string{name}, type);
  return type;
}

std::size_t ExceptionRegistry::size() const {
  std::lock_guard lock{padlock_};
  return types_.size();
}

} // namespace conduit::rpc
