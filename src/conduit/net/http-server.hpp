
#pragma once

#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace boost::asio
{
class io_context;
}

namespace conduit::rpc
{
class Service;
}

namespace conduit::net
{

// -------------------------------------------------------------------------------------- HttpServer

class HttpServer
{
 private:
   struct Pimpl;
   std::unique_ptr<Pimpl> pimpl_;

 public:
   /**
    * @brief Answers one POST. `target` is the request path, without any query string.
    */
   using RequestHandler = std::function<HttpResponse(std::string_view target, std::string body)>;

   struct Config
   {
      std::string address         = "0.0.0.0"; //! Listen address
      uint16_t port               = 0;         //! Listen port; 0 picks a free port
      std::size_t max_body_size   = 102400;    //! Larger requests get 413
      std::chrono::seconds timeout = std::chrono::seconds{30}; //! Per read/write

      // TLS is used iff a certificate chain is given
      std::string dh_file                = {}; //! For key-exchange
      std::string certificate_chain_file = {}; //! Server certificate
      std::string private_key_file       = {}; //! Private key

      /**
       * @brief Called for every POST, from the io_context's threads.
       * @note Must be set.
       */
      RequestHandler handler;
   };

   /**
    * Exceptions
    * + std::bad_alloc
    * + boost::system::system_error When the TLS files cannot be loaded
    */
   HttpServer(boost::asio::io_context& io_context, const Config& config);
   HttpServer(const HttpServer&) = delete;
   HttpServer(HttpServer&&)      = default;
   ~HttpServer();
   HttpServer& operator=(const HttpServer&) = delete;
   HttpServer& operator=(HttpServer&&)      = default;

   /**
    * @brief Start accepting connections on the configured address and port.
    */
   std::error_code run();

   /**
    * @brief Stop accepting connections. Sessions in flight run to completion.
    */
   void shutdown();

   /**
    * @brief The bound port; useful when `Config::port` is 0.
    */
   uint16_t local_port() const;
};

/**
 * @brief A `RequestHandler` that forwards to `service`, which must outlive the server.
 */
HttpServer::RequestHandler make_service_handler(rpc::Service& service);

} // namespace conduit::net
