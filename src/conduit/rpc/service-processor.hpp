
#pragma once

#include "codec.hpp"
#include "processor.hpp"

#include <exception>
#include <functional>
#include <string>

namespace conduit::rpc {

/**
 * @brief Implements one operation: reads `request`, and fills in `response`, or throws.
 */
using Handler = std::function<void(Container& request, Container& response, Context& context)>;

/**
 * @brief Server side of one call: wire text in, wire text out.
 *
 * The request body is deserialized on entry to `OPERATION` scope, and the response serialized on
 * exit from it. Anything thrown by a plugin or the handler is caught here, once, and turned into
 * a fault response; see `rpc-wire`.
 */
class ServiceProcessor final : public Processor {
private:
  const Api& api_;
  const Codec& codec_;
  const Handler* handler_{nullptr};
  bool is_serialized_{false};

  void serialize_response_();
  void marshal_fault_(std::exception_ptr eptr);

protected:
  void run() override;
  void execute() override;
  void enter_scope(Scope scope) override;
  void exit_scope(Scope scope) override;

public:
  /**
   * @param handler May be null, in which case the call fails with `missing_handler`.
   */
  ServiceProcessor(const Api& api, const Codec& codec, const PluginRegistry& plugins,
                   const OperationDescriptor& descriptor, const Handler* handler,
                   std::string request_body);

  /**
   * @brief The response body, after `process()`.
   */
  const std::string& result() const noexcept { return response_body_; }
};

} // namespace conduit::rpc
