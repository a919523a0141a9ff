
#include "stdinc.hpp"

#include "http-server.hpp"

#include "conduit/rpc/service.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <atomic>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace conduit::net::detail
{
namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = asio::ip::tcp;

// ---------------------------------------------------------------------------------- ServerSettings

struct ServerSettings
{
   HttpServer::RequestHandler handler;
   std::size_t max_body_size    = 0;
   std::chrono::seconds timeout = std::chrono::seconds{30};
};

// ----------------------------------------------------------------------------------------- Session

// Reads POST requests off one connection, and answers each with `settings->handler`
template<typename Stream> class Session : public std::enable_shared_from_this<Session<Stream>>
{
 private:
   static constexpr bool k_is_tls = !std::is_same_v<Stream, beast::tcp_stream>;

   const uint64_t id_;
   std::shared_ptr<const ServerSettings> settings_;
   Stream stream_;
   beast::flat_buffer buffer_;
   std::optional<http::request_parser<http::string_body>> parser_;
   http::response<http::string_body> res_;

   auto self() { return this->shared_from_this(); }

 public:
   // Take ownership of the socket
   template<typename... Args>
   Session(tcp::socket&& socket,
           std::shared_ptr<const ServerSettings> settings,
           uint64_t id,
           Args&... args)
       : id_{id}
       , settings_{std::move(settings)}
       , stream_{std::move(socket), args...}
   {
      TRACE("session {} created", id_);
   }

   ~Session() { TRACE("session {} deleted", id_); }

   // Get on the correct executor
   void run()
   {
      // We need to be executing within a strand to perform async operations
      // on the I/O objects in this session.
      asio::dispatch(stream_.get_executor(), beast::bind_front_handler(&Session::on_run, self()));
   }

   void on_run()
   {
      if constexpr(k_is_tls) {
         beast::get_lowest_layer(stream_).expires_after(settings_->timeout);
         stream_.async_handshake(asio::ssl::stream_base::server,
                                 beast::bind_front_handler(&Session::on_handshake, self()));
      } else {
         do_read();
      }
   }

   void on_handshake(beast::error_code ec)
   {
      if(ec) {
         INFO("session {}, error on handshake: {}", id_, ec.message());
         return;
      }
      do_read();
   }

   void do_read()
   {
      // A fresh parser for every request, so that the body limit applies to each
      parser_.emplace();
      parser_->body_limit(settings_->max_body_size);

      beast::get_lowest_layer(stream_).expires_after(settings_->timeout);
      http::async_read(
          stream_, buffer_, *parser_, beast::bind_front_handler(&Session::on_read, self()));
   }

   void on_read(beast::error_code ec, std::size_t bytes_transferred)
   {
      boost::ignore_unused(bytes_transferred);

      // This indicates that the client closed the connection
      if(ec == http::error::end_of_stream) {
         do_close();
         return;
      }

      if(ec == http::error::body_limit) {
         INFO("session {}, request body exceeds {} bytes", id_, settings_->max_body_size);
         send_(make_response(413), false);
         return;
      }

      if(ec) {
         INFO("session {}, error on read: {}", id_, ec.message());
         return;
      }

      auto req              = parser_->release();
      const bool keep_alive = req.keep_alive();

      if(req.method() != http::verb::post) {
         send_(make_response(405), keep_alive);
         return;
      }

      const auto target = std::string_view{req.target().data(), req.target().size()};
      send_(handle_(target.substr(0, target.find('?')), std::move(req.body())), keep_alive);
   }

   void on_write(beast::error_code ec, std::size_t bytes_transferred)
   {
      if(ec) {
         INFO("session {}, error on write: {}", id_, ec.message());
         return;
      }
      TRACE("session {}, wrote {} bytes", id_, bytes_transferred);

      if(!res_.keep_alive()) {
         do_close();
         return;
      }
      do_read();
   }

   void do_close()
   {
      if constexpr(k_is_tls) {
         beast::get_lowest_layer(stream_).expires_after(settings_->timeout);
         stream_.async_shutdown(beast::bind_front_handler(&Session::on_shutdown, self()));
      } else {
         beast::error_code ec;
         stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
         if(ec) TRACE("session {}, error on shutdown: {}", id_, ec.message());
      }
   }

   void on_shutdown(beast::error_code ec)
   {
      if(ec) TRACE("session {}, error on shutdown: {}", id_, ec.message());
   }

 private:
   HttpResponse handle_(std::string_view target, std::string body)
   {
      try {
         return settings_->handler(target, std::move(body));
      } catch(std::exception& e) {
         LOG_ERR("session {}, handler failed on '{}': {}", id_, target, e.what());
      }
      return make_response(500);
   }

   void send_(HttpResponse response, bool keep_alive)
   {
      res_ = http::response<http::string_body>{};
      res_.version(11);
      res_.result(response.status);
      res_.set(http::field::server, BOOST_BEAST_VERSION_STRING);
      res_.set(http::field::content_type, "application/json");
      if(response.status == 405) res_.set(http::field::allow, "POST");
      res_.keep_alive(keep_alive);
      res_.body() = std::move(response.body);
      res_.prepare_payload();

      beast::get_lowest_layer(stream_).expires_after(settings_->timeout);
      http::async_write(stream_, res_, beast::bind_front_handler(&Session::on_write, self()));
   }
};

// ---------------------------------------------------------------------------------------- Listener

// Accepts incoming connections and launches the sessions
class Listener : public std::enable_shared_from_this<Listener>
{
 private:
   asio::io_context& ioc_;
   asio::ssl::context* tls_context_;
   tcp::acceptor acceptor_;
   std::shared_ptr<const ServerSettings> settings_;
   beast::error_code ec_;
   std::atomic<uint64_t> session_id_;

 public:
   Listener(asio::io_context& ioc,
            asio::ssl::context* tls_context,
            tcp::endpoint endpoint,
            std::shared_ptr<const ServerSettings> settings)
       : ioc_{ioc}
       , tls_context_{tls_context}
       , acceptor_{asio::make_strand(ioc)}
       , settings_{std::move(settings)}
       , ec_{}
       , session_id_{1}
   {
      // Open the acceptor
      acceptor_.open(endpoint.protocol(), ec_);
      if(ec_) return;

      // Allow address reuse
      acceptor_.set_option(asio::socket_base::reuse_address(true), ec_);
      if(ec_) return;

      // Bind to the server address
      acceptor_.bind(endpoint, ec_);
      if(ec_) return;

      // Start listening for connections
      acceptor_.listen(asio::socket_base::max_listen_connections, ec_);
      if(ec_) return;
   }

   // Start accepting incoming connections
   beast::error_code run()
   {
      if(!ec_) do_accept_();
      return ec_;
   }

   void close()
   {
      asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
         beast::error_code ec;
         self->acceptor_.close(ec);
         if(ec) INFO("http-server error on close: {}", ec.message());
      });
   }

   uint16_t local_port() const
   {
      beast::error_code ec;
      const auto endpoint = acceptor_.local_endpoint(ec);
      return ec ? uint16_t(0) : endpoint.port();
   }

 private:
   void do_accept_()
   {
      // The new connection gets its own strand
      acceptor_.async_accept(asio::make_strand(ioc_),
                             beast::bind_front_handler(&Listener::on_accept_, shared_from_this()));
   }

   void on_accept_(beast::error_code ec, tcp::socket socket)
   {
      if(ec == asio::error::operation_aborted) {
         TRACE("http-server stopped accepting");
         return;
      }

      if(ec) {
         INFO("http-server on-accept error: {}", ec.message());
      } else {
         const auto id = session_id_.fetch_add(1, std::memory_order_acq_rel);
         if(tls_context_ != nullptr)
            std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(
                std::move(socket), settings_, id, *tls_context_)
                ->run();
         else
            std::make_shared<Session<beast::tcp_stream>>(std::move(socket), settings_, id)->run();
      }

      // Accept another connection
      do_accept_();
   }
};

} // namespace conduit::net::detail

namespace conduit::net
{
namespace asio = boost::asio;

// ------------------------------------------------------------------------------------------- Pimpl

struct HttpServer::Pimpl
{
   asio::io_context& io_context;
   std::unique_ptr<asio::ssl::context> tls_context    = nullptr;
   std::shared_ptr<detail::Listener> listener         = nullptr;

   Pimpl(boost::asio::io_context& io_context_, const Config& config)
       : io_context{io_context_}
   {
      if(!config.handler) throw std::invalid_argument{"HttpServer requires a handler"};

      if(!config.certificate_chain_file.empty()) {
         tls_context = std::make_unique<asio::ssl::context>(asio::ssl::context::tlsv12);
         tls_context->set_options(asio::ssl::context::default_workarounds
                                  | asio::ssl::context::no_sslv2
                                  | asio::ssl::context::single_dh_use);
         tls_context->use_certificate_chain_file(config.certificate_chain_file);
         tls_context->use_private_key_file(config.private_key_file, asio::ssl::context::pem);
         if(!config.dh_file.empty()) tls_context->use_tmp_dh_file(config.dh_file);
      }

      auto settings           = std::make_shared<detail::ServerSettings>();
      settings->handler       = config.handler;
      settings->max_body_size = config.max_body_size;
      settings->timeout       = config.timeout;

      listener = std::make_shared<detail::Listener>(
          io_context,
          tls_context.get(),
          asio::ip::tcp::endpoint{asio::ip::make_address(config.address), config.port},
          std::move(settings));
   }
};

// ------------------------------------------------------------------------------------ Construction

HttpServer::HttpServer(boost::asio::io_context& io_context, const Config& config)
    : pimpl_{std::make_unique<Pimpl>(io_context, config)}
{}

HttpServer::~HttpServer() = default;

std::error_code HttpServer::run()
{
   // Create and launch a listening port
   if(pimpl_->listener == nullptr) return std::make_error_code(std::errc::not_connected);
   return pimpl_->listener->run();
}

void HttpServer::shutdown()
{
   if(pimpl_->listener != nullptr) pimpl_->listener->close();
}

uint16_t HttpServer::local_port() const
{
   return (pimpl_->listener == nullptr) ? uint16_t(0) : pimpl_->listener->local_port();
}

HttpServer::RequestHandler make_service_handler(rpc::Service& service)
{
   return [&service](std::string_view target, std::string body) {
      return service.handle_request(target, std::move(body));
   };
}

} // namespace conduit::net
