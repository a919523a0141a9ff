
#include "stdinc.hpp"

#include "plugin-registry.hpp"

#include "errors.hpp"

namespace conduit::rpc {

std::string_view str(Scope scope) noexcept {
  switch (scope) {
  case Scope::REQUEST: return "request";
  case Scope::OPERATION: return "operation";
  case Scope::FUNCTION: return "function";
  case Scope::DONE: return "done";
  }
  return "<unknown>";
}

void PluginRegistry::add(Scope scope, Plugin plugin) {
  const bool fits = (scope == Scope::REQUEST && std::holds_alternative<RequestPlugin>(plugin))
                    || (scope == Scope::OPERATION && std::holds_alternative<OperationPlugin>(plugin));
  if (!fits)
    throw ValidationError{ecode::invalid_scope,
                          fmt::format("plugin does not fit scope '{}'", str(scope))};

  std::lock_guard lock{padlock_};
  if (is_finalized())
    throw ValidationError{ecode::registry_finalized,
                          fmt::format("cannot add a '{}' plugin after the first call", str(scope))};

  if (scope == Scope::REQUEST)
    request_plugins_.push_back(std::get<RequestPlugin>(std::move(plugin)));
  else
    operation_plugins_.push_back(std::get<OperationPlugin>(std::move(plugin)));
}

void PluginRegistry::finalize() {
  std::call_once(finalize_flag_, [this]() {
    std::lock_guard lock{padlock_};
    is_finalized_.store(true, std::memory_order_release);
    LOG_DEBUG("plugins finalized: {} request, {} operation", request_plugins_.size(),
              operation_plugins_.size());
  });
}

std::size_t PluginRegistry::size(Scope scope) const noexcept {
  switch (scope) {
  case Scope::REQUEST: return request_plugins_.size();
  case Scope::OPERATION: return operation_plugins_.size();
  default: return 0;
  }
}

} // namespace conduit::rpc
