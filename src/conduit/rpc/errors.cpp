
#include "stdinc.hpp"

#include "errors.hpp"
#include "exception-registry.hpp"

namespace conduit::rpc {

std::string describe_fault(const std::string& name, const ValueList& args) {
  std::string out = name;
  out += '(';
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i > 0)
      out += ", ";
    out += args[i].dump(-1, ' ', false, Value::error_handler_t::replace);
  }
  out += ')';
  return out;
}

// ------------------------------------------------------------------------------------------- Fault

Fault::Fault(std::string name, ValueList args)
    : std::runtime_error{describe_fault(name, args)}, name_{std::move(name)},
      args_{std::move(args)} {}

Fault::Fault(std::shared_ptr<const FaultType> type, ValueList args)
    : std::runtime_error{describe_fault(type->name(), args)}, type_{std::move(type)},
      name_{type_->name()}, args_{std::move(args)} {}

// -------------------------------------------------------------------------------- RequestException

RequestException::RequestException(ValueList args) : Fault{k_name, std::move(args)} {}

RequestException::RequestException(std::shared_ptr<const FaultType> type, ValueList args)
    : Fault{std::move(type), std::move(args)} {}

} // namespace conduit::rpc
