
#include "stdinc.hpp"

#include "loopback-transport.hpp"

#include "conduit/rpc/service.hpp"

namespace conduit::net {

tl::expected<HttpResponse, std::error_code>
LoopbackTransport::post(const std::string& uri, const std::string& body, std::chrono::milliseconds) {
  auto parts = parse_uri(uri);
  if (!parts)
    return tl::make_unexpected(parts.error());
  const auto& target = parts->target;
  return service_->handle_request(std::string_view{target}.substr(0, target.find('?')), body);
}

} // namespace conduit::net
