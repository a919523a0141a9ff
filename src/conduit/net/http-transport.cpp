
#include "stdinc.hpp"

#include "http-transport.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <type_traits>

namespace conduit::net::detail {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

// ------------------------------------------------------------------------------------- PostSession

// One POST, start to finish, on a single-threaded io_context
template <typename Stream> class PostSession : public std::enable_shared_from_this<PostSession<Stream>> {
private:
  static constexpr bool k_is_tls = !std::is_same_v<Stream, beast::tcp_stream>;

  tcp::resolver resolver_;
  Stream stream_;
  beast::flat_buffer buffer_{};
  http::request<http::string_body> req_{};
  http::response<http::string_body> res_{};
  std::chrono::milliseconds timeout_;
  std::string host_{};
  beast::error_code ec_{};
  bool is_complete_{false};

  auto self() { return this->shared_from_this(); }

  void fail_(beast::error_code ec, const char* what) {
    TRACE("POST to {} failed on {}: {}", host_, what, ec.message());
    ec_ = ec;
  }

public:
  template <typename... Args>
  PostSession(asio::io_context& ioc, std::chrono::milliseconds timeout, Args&... args)
      : resolver_{ioc}, stream_{ioc, args...}, timeout_{timeout} {}

  void run(const Uri& uri, const std::string& body, const std::string& user_agent) {
    host_ = uri.host;

    req_.method(http::verb::post);
    req_.target(uri.target);
    req_.version(11);
    req_.set(http::field::host, fmt::format("{}:{}", uri.host, uri.port));
    req_.set(http::field::user_agent, user_agent);
    req_.set(http::field::content_type, "application/json");
    req_.body() = body;
    req_.prepare_payload();

    resolver_.async_resolve(uri.host, std::to_string(uri.port),
                            beast::bind_front_handler(&PostSession::on_resolve, self()));
  }

  void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec)
      return fail_(ec, "resolve");

    beast::get_lowest_layer(stream_).expires_after(timeout_);
    beast::get_lowest_layer(stream_).async_connect(
        results, beast::bind_front_handler(&PostSession::on_connect, self()));
  }

  void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec)
      return fail_(ec, "connect");

    if constexpr (k_is_tls) {
      // Set SNI Hostname (many hosts need this to handshake successfully)
      if (!SSL_set_tlsext_host_name(stream_.native_handle(), host_.c_str())) {
        ec = beast::error_code{static_cast<int>(::ERR_get_error()),
                               asio::error::get_ssl_category()};
        return fail_(ec, "sni");
      }
      beast::get_lowest_layer(stream_).expires_after(timeout_);
      stream_.async_handshake(asio::ssl::stream_base::client,
                              beast::bind_front_handler(&PostSession::on_handshake, self()));
    } else {
      do_write_();
    }
  }

  void on_handshake(beast::error_code ec) {
    if (ec)
      return fail_(ec, "handshake");
    do_write_();
  }

  void on_write(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec)
      return fail_(ec, "write");
    TRACE("wrote {} bytes to {}", bytes_transferred, host_);

    beast::get_lowest_layer(stream_).expires_after(timeout_);
    http::async_read(stream_, buffer_, res_,
                     beast::bind_front_handler(&PostSession::on_read, self()));
  }

  void on_read(beast::error_code ec, std::size_t) {
    if (ec)
      return fail_(ec, "read");
    is_complete_ = true;

    // Not connected is fine; the server may have closed already
    beast::error_code ignored;
    beast::get_lowest_layer(stream_).socket().shutdown(tcp::socket::shutdown_both, ignored);
  }

  tl::expected<HttpResponse, std::error_code> result() {
    if (ec_)
      return tl::make_unexpected(std::error_code{ec_});
    if (!is_complete_)
      return tl::make_unexpected(make_error_code(ecode::transport_error));
    const auto reason = res_.reason();
    return HttpResponse{res_.result_int(), std::move(res_.body()),
                        std::string(reason.data(), reason.size())};
  }

private:
  void do_write_() {
    beast::get_lowest_layer(stream_).expires_after(timeout_);
    http::async_write(stream_, req_, beast::bind_front_handler(&PostSession::on_write, self()));
  }
};

} // namespace conduit::net::detail

namespace conduit::net {

// ------------------------------------------------------------------------------------------- Pimpl

struct HttpTransport::Pimpl {
  Config config;
  boost::asio::ssl::context ssl_context;

  explicit Pimpl(const Config& config_)
      : config{config_}, ssl_context{boost::asio::ssl::context::tlsv12_client} {
    ssl_context.set_default_verify_paths();
    ssl_context.set_verify_mode(config.verify_peer ? boost::asio::ssl::verify_peer
                                                   : boost::asio::ssl::verify_none);
  }
};

// ----------------------------------------------------------------------------------- HttpTransport

HttpTransport::HttpTransport() : HttpTransport{Config{}} {}

HttpTransport::HttpTransport(const Config& config) : pimpl_{std::make_unique<Pimpl>(config)} {}

HttpTransport::~HttpTransport() = default;

tl::expected<HttpResponse, std::error_code>
HttpTransport::post(const std::string& uri, const std::string& body,
                    std::chrono::milliseconds timeout) {
  namespace beast = boost::beast;

  const auto parts = parse_uri(uri);
  if (!parts)
    return tl::make_unexpected(parts.error());

  boost::asio::io_context ioc;
  if (parts->scheme == "http") {
    auto session = std::make_shared<detail::PostSession<beast::tcp_stream>>(ioc, timeout);
    session->run(*parts, body, pimpl_->config.user_agent);
    ioc.run();
    return session->result();
  }

  if (parts->scheme == "https") {
    auto session = std::make_shared<detail::PostSession<beast::ssl_stream<beast::tcp_stream>>>(
        ioc, timeout, pimpl_->ssl_context);
    session->run(*parts, body, pimpl_->config.user_agent);
    ioc.run();
    return session->result();
  }

  WARN("unsupported scheme in uri: {}", uri);
  return tl::make_unexpected(std::make_error_code(std::errc::protocol_not_supported));
}

} // namespace conduit::net
