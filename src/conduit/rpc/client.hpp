
#pragma once

#include "codec.hpp"
#include "description.hpp"
#include "exception-registry.hpp"
#include "plugin-registry.hpp"

#include "conduit/net/transport.hpp"

#include <memory>
#include <string_view>

namespace conduit::rpc {

/**
 * @brief Calls the operations of one api, through a `net::Transport`.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto client = Client{config, std::make_shared<net::HttpTransport>()};
 * auto result = client.call("upper", {"hi"}); // "HI"
 * ~~~~~~~~~~~~~~~~~~~~~~
 *
 * Faults raised by the service are rethrown by name: builtin names as their C++ exception
 * type, and other names as a `Fault` carrying this client's `FaultType`.
 */
class Client {
private:
  Api api_;
  std::shared_ptr<net::Transport> transport_;
  std::shared_ptr<const Codec> codec_;
  PluginRegistry plugins_;
  ExceptionRegistry exceptions_;

public:
  /**
   * @throws ValidationError if the endpoint cannot form a uri.
   */
  Client(ApiConfig config, std::shared_ptr<net::Transport> transport,
         std::shared_ptr<const Codec> codec = make_json_codec());

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  const Api& api() const noexcept { return api_; }
  const ExceptionRegistry& exceptions() const noexcept { return exceptions_; }

  void plugin(Scope scope, Plugin plugin);

  /**
   * @brief Calls `operation` with positional `args`, in declared input order.
   * @return null with no declared outputs, the bare value with one, or an array in declared
   *         output order.
   */
  Value call(std::string_view operation, ValueList args = {});

  /**
   * @brief Calls `operation` with named request fields, and returns the response fields.
   */
  Container call_fields(std::string_view operation, Container request);
};

} // namespace conduit::rpc
