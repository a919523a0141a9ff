
#include "stdinc.hpp"

#include "transport.hpp"

#include <boost/beast/http/status.hpp>

#include <charconv>

namespace conduit::net {

std::string reason_phrase(unsigned status) {
  namespace http = boost::beast::http;
  const auto phrase = http::obsolete_reason(http::int_to_status(status));
  return std::string(phrase.data(), phrase.size());
}

tl::expected<Uri, std::error_code> parse_uri(std::string_view uri) {
  const auto bad_uri = [uri]() {
    TRACE("malformed uri: '{}'", uri);
    return tl::make_unexpected(make_error_code(ecode::argument_error));
  };

  Uri out;
  const auto scheme_end = uri.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0)
    return bad_uri();
  out.scheme = uri.substr(0, scheme_end);
  uri.remove_prefix(scheme_end + 3);

  const auto target_begin = uri.find('/');
  auto authority = uri.substr(0, target_begin);
  out.target = (target_begin == std::string_view::npos) ? "/" : uri.substr(target_begin);

  const auto colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    const auto digits = authority.substr(colon + 1);
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), out.port);
    if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size())
      return bad_uri();
    authority = authority.substr(0, colon);
  } else if (out.scheme == "http") {
    out.port = 80;
  } else if (out.scheme == "https") {
    out.port = 443;
  } else {
    return bad_uri();
  }

  if (authority.empty())
    return bad_uri();
  out.host = authority;
  return out;
}

} // namespace conduit::net
