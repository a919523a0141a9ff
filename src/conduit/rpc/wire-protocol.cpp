
#include "stdinc.hpp"

#include "wire-protocol.hpp"

#include <boost/core/demangle.hpp>

#include <typeinfo>

namespace conduit::rpc {

namespace {

  /// @private
  WireFault what_fault(std::string name, const std::exception& e) {
    return {std::move(name), {Value(e.what())}};
  }

  /// @private
  /// "std::invalid_argument" => "invalid_argument"
  /// "app::(anonymous namespace)::TextTooLong" => "TextTooLong"
  std::string unqualified_name(std::string name) {
    if (!name.empty() && name.back() == ']') // e.g., "failure[abi:cxx11]"
      name.erase(name.rfind('['));

    int depth = 0;
    for (auto i = name.size(); i > 1; --i) {
      const char c = name[i - 1];
      if (c == '>' || c == ')')
        ++depth;
      else if (c == '<' || c == '(')
        --depth;
      else if (depth == 0 && c == ':' && name[i - 2] == ':')
        return name.substr(i);
    }
    return name.empty() ? std::string{"exception"} : name;
  }

} // namespace

Value WireFault::to_value() const {
  auto out = Value::object();
  out["cls"] = cls;
  out["args"] = Value::array();
  for (const auto& arg : args)
    out["args"].push_back(arg);
  return out;
}

WireFault WireFault::from_value(const Value& value) {
  if (!value.is_object() || !value.contains("cls") || !value.contains("args"))
    throw ProtocolError{ecode::invalid_response,
                        fmt::format("malformed fault: {}", value.dump())};

  const auto& cls = value["cls"];
  const auto& args = value["args"];
  if (!cls.is_string() || !args.is_array())
    throw ProtocolError{ecode::invalid_response,
                        fmt::format("malformed fault: {}", value.dump())};

  return {cls.get<std::string>(), ValueList(args.begin(), args.end())};
}

WireFault describe_exception(std::exception_ptr eptr) {
  try {
    std::rethrow_exception(eptr);
  } catch (const Fault& e) {
    return {e.name(), e.args()};
  } catch (const ValidationError& e) {
    return what_fault("ValidationError", e);
  } catch (const ProtocolError& e) {
    return what_fault("ProtocolError", e);
  } catch (const StateError& e) {
    return what_fault("StateError", e);
  } catch (const std::exception& e) {
    return what_fault(unqualified_name(boost::core::demangle(typeid(e).name())), e);
  } catch (...) {
    return {"exception", {}};
  }
}

std::optional<WireFault> extract_fault(const Container& response) {
  if (!response.contains(k_exception_key))
    return std::nullopt;
  return WireFault::from_value(response[k_exception_key]);
}

void embed_fault(Container& response, const WireFault& fault) {
  response.clear();
  response.set(k_exception_key, fault.to_value());
}

} // namespace conduit::rpc
