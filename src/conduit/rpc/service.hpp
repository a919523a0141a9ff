
#pragma once

#include "codec.hpp"
#include "description.hpp"
#include "exception-registry.hpp"
#include "plugin-registry.hpp"
#include "service-processor.hpp"

#include "conduit/net/transport.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace conduit::rpc {

/**
 * @brief Serves the operations of one api.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto service = Service{ApiConfig::from_string(description)};
 * service.operation("upper", [](Container& request, Container& response, Context&) {
 *   response.set("result", to_upper(request["text"].get<std::string>()));
 * });
 * service.validate();
 * ~~~~~~~~~~~~~~~~~~~~~~
 *
 * Plugins and handlers are registered up front. The first call closes registration, after which
 * any number of threads may call `dispatch` and `handle_request`. A bind that races with the
 * first call either lands before it, or fails with `registry_finalized`.
 */
class Service {
private:
  Api api_;
  std::shared_ptr<const Codec> codec_;
  PluginRegistry plugins_;
  ExceptionRegistry exceptions_;
  std::map<std::string, Handler, std::less<>> handlers_;
  mutable std::mutex padlock_; // guards `handlers_` until the first call

  void close_registration_();

public:
  static constexpr std::size_t k_max_body_size = 102400;

  explicit Service(ApiConfig config, std::shared_ptr<const Codec> codec = make_json_codec());

  Service(const Service&) = delete;
  Service& operator=(const Service&) = delete;

  const Api& api() const noexcept { return api_; }

  /**
   * @brief For handlers that raise described faults by name.
   */
  const ExceptionRegistry& exceptions() const noexcept { return exceptions_; }

  /**
   * @throws ValidationError if the plugin does not fit `scope`, or a call has been made.
   */
  void plugin(Scope scope, Plugin plugin);

  /**
   * @brief Binds `handler` to a described operation.
   * @throws ValidationError `unknown_operation`, `already_bound`, or `registry_finalized`
   */
  void operation(std::string_view name, Handler handler);

  /**
   * @throws ValidationError `missing_handler` if a described operation has no handler.
   */
  void validate() const;

  /**
   * @brief Runs one call to `operation`, and returns the response body. Faults are marshalled
   *        into the body; see `rpc-wire`.
   * @throws ValidationError `unknown_operation`
   */
  std::string dispatch(std::string_view operation, std::string body);

  /**
   * @brief Entry point for a transport: 404 for an unknown path, 413 for an oversized body, and
   *        otherwise 200 with the response body.
   */
  net::HttpResponse handle_request(std::string_view path, std::string body);
};

} // namespace conduit::rpc
