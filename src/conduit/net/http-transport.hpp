
#pragma once

#include "transport.hpp"

#include <memory>
#include <string>

namespace conduit::net {

/**
 * @brief Synchronous HTTP/1.1 POST, over plain tcp or TLS.
 *
 * Each `post` runs its own connection to completion; the timeout bounds each network step
 * (connect, handshake, write, read). Safe to call from several threads at once.
 */
class HttpTransport final : public Transport {
public:
  struct Config {
    bool verify_peer = true;                   //!< Verify the server certificate (https)
    std::string user_agent = "conduit-client"; //!< User-Agent header
  };

private:
  struct Pimpl;
  std::unique_ptr<Pimpl> pimpl_;

public:
  HttpTransport();
  explicit HttpTransport(const Config& config);
  HttpTransport(const HttpTransport&) = delete;
  ~HttpTransport();
  HttpTransport& operator=(const HttpTransport&) = delete;

  tl::expected<HttpResponse, std::error_code> post(const std::string& uri, const std::string& body,
                                                   std::chrono::milliseconds timeout) override;
};

} // namespace conduit::net
