
#pragma once

#include "transport.hpp"

#include "conduit/utils/base/pointer.hpp"

namespace conduit::rpc {
class Service;
}

namespace conduit::net {

/**
 * @brief Hands each request straight to an in-process `Service`.
 *
 * Only the target of the uri is used; the timeout is ignored. The service must outlive the
 * transport.
 */
class LoopbackTransport final : public Transport {
private:
  observer_ptr<rpc::Service> service_;

public:
  explicit LoopbackTransport(rpc::Service& service) : service_{&service} {}

  tl::expected<HttpResponse, std::error_code> post(const std::string& uri, const std::string& body,
                                                   std::chrono::milliseconds timeout) override;
};

} // namespace conduit::net
