
#pragma once

#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace conduit::net {

// ------------------------------------------------------------------------------------ HttpResponse

struct HttpResponse {
  unsigned status{0};
  std::string body;
  std::string reason;

  bool ok() const noexcept { return status >= 200 && status < 300; }
};

/**
 * @brief Standard reason phrase for `status`, such as "Not Found".
 */
std::string reason_phrase(unsigned status);

inline HttpResponse make_response(unsigned status, std::string body = {}) {
  return {status, std::move(body), reason_phrase(status)};
}

// --------------------------------------------------------------------------------------------- Uri

struct Uri {
  std::string scheme;
  std::string host;
  uint16_t port{0};
  std::string target; //!< Path and query, at least "/"
};

/**
 * @brief Splits "scheme://host[:port][/target]". The port defaults to 80 for http, and 443 for
 *        https.
 */
tl::expected<Uri, std::error_code> parse_uri(std::string_view uri);

// --------------------------------------------------------------------------------------- Transport

/**
 * @brief Delivers one request body, and returns the response.
 *
 * Failure to deliver, or to read a response, is an error code. Any HTTP response, including
 * 4xx and 5xx, is a value.
 */
class Transport {
public:
  virtual ~Transport() = default;

  virtual tl::expected<HttpResponse, std::error_code>
  post(const std::string& uri, const std::string& body, std::chrono::milliseconds timeout) = 0;
};

} // namespace conduit::net
