
#include "stdinc.hpp"

#include "service.hpp"

namespace conduit::rpc {

Service::Service(ApiConfig config, std::shared_ptr<const Codec> codec)
    : api_{std::move(config)}, codec_{std::move(codec)} {
  if (codec_ == nullptr)
    throw ValidationError{ecode::argument_error, "service requires a codec"};
}

void Service::plugin(Scope scope, Plugin plugin) { plugins_.add(scope, std::move(plugin)); }

void Service::operation(std::string_view name, Handler handler) {
  std::lock_guard lock{padlock_};
  if (plugins_.is_finalized())
    throw ValidationError{ecode::registry_finalized,
                          fmt::format("cannot bind '{}' after the first call", name)};
  if (api_.find_operation(name) == nullptr)
    throw ValidationError{ecode::unknown_operation,
                          fmt::format("'{}' is not an operation of api '{}'", name, api_.name())};
  if (!handler)
    throw ValidationError{ecode::argument_error, fmt::format("empty handler for '{}'", name)};
  if (!handlers_.emplace(std::string{name}, std::move(handler)).second)
    throw ValidationError{ecode::already_bound,
                          fmt::format("operation '{}' already has a handler", name)};
}

void Service::close_registration_() {
  if (!plugins_.is_finalized()) {
    std::lock_guard lock{padlock_};
    plugins_.finalize();
  }
}

void Service::validate() const {
  std::lock_guard lock{padlock_};
  for (const auto& [name, op] : api_.config().operations)
    if (handlers_.find(name) == handlers_.end())
      throw ValidationError{ecode::missing_handler,
                            fmt::format("operation '{}' has no handler", name)};
}

std::string Service::dispatch(std::string_view operation, std::string body) {
  const auto descriptor = api_.find_operation(operation);
  if (descriptor == nullptr)
    throw ValidationError{ecode::unknown_operation,
                          fmt::format("'{}' is not an operation of api '{}'", operation,
                                      api_.name())};

  close_registration_();

  const auto ii = handlers_.find(operation);
  const Handler* handler = (ii == handlers_.end()) ? nullptr : &ii->second;

  ServiceProcessor processor{api_, *codec_, plugins_, *descriptor, handler, std::move(body)};
  processor.process();
  return processor.result();
}

net::HttpResponse Service::handle_request(std::string_view path, std::string body) {
  const auto operation = api_.matcher().match(path);
  if (!operation || api_.find_operation(*operation) == nullptr) {
    LOG_DEBUG("no operation at '{}'", path);
    return net::make_response(404);
  }

  if (body.size() > k_max_body_size) {
    INFO("call to '{}' rejected, body of {} bytes", *operation, body.size());
    return net::make_response(413);
  }

  try {
    return net::make_response(200, dispatch(*operation, std::move(body)));
  } catch (const std::exception& e) {
    LOG_ERR("call to '{}' failed: {}", *operation, e.what());
  }
  return net::make_response(500);
}

} // namespace conduit::rpc
