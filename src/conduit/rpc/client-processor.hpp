
#pragma once

#include "codec.hpp"
#include "exception-registry.hpp"
#include "processor.hpp"

#include "conduit/net/transport.hpp"

namespace conduit::rpc {

/**
 * @brief Client side of one call: posts the request, and unmarshals the response.
 *
 * A transport failure, or a non-2xx status, throws `RequestException`. A fault in the response
 * is rebuilt by name through the client's `ExceptionRegistry`, and thrown.
 */
class ClientProcessor final : public Processor {
private:
  const Api& api_;
  const Codec& codec_;
  net::Transport& transport_;
  const ExceptionRegistry& exceptions_;

protected:
  void execute() override;

public:
  ClientProcessor(const Api& api, const Codec& codec, const PluginRegistry& plugins,
                  const OperationDescriptor& descriptor, net::Transport& transport,
                  const ExceptionRegistry& exceptions, Container request);

  /**
   * @brief The response fields, after `process()`.
   */
  const Container& result() const noexcept { return response_; }
  Container take_result() noexcept { return std::move(response_); }
};

} // namespace conduit::rpc
