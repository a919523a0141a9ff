
#include "stdinc.hpp"

#include "echo-api.hpp"

#include "conduit/net.hpp"
#include "conduit/rpc.hpp"
#include "conduit/utils.hpp"

#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>

namespace conduit::example
{
struct Config
{
   bool show_help{false};
   string address{"0.0.0.0"};
   uint16_t port{8080};
   int n_threads{2};
};

static void show_help(const char* exec)
{
   cout << format(R"(

   Usage: {} [-a <address>] [-p <port>] [-t <threads>]

      Serves the "echo" api over http.

)",
                  exec);
}

static void register_echo(rpc::Service& service)
{
   // Request scope: time every call
   service.plugin(rpc::Scope::REQUEST, rpc::RequestPlugin{[](rpc::Context& context) {
                     const auto start = std::chrono::steady_clock::now();
                     context.next();
                     const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                         std::chrono::steady_clock::now() - start);
                     INFO("{} took {}us", context.operation(), micros.count());
                  }});

   service.operation("echo",
                     [&service](rpc::Container& request, rpc::Container& response, rpc::Context&) {
                        const auto& value = request["value"];
                        if(value.is_string() && value.get_ref<const string&>().size() > k_max_echo_length)
                           service.exceptions().raise("EchoTooLong", {k_max_echo_length});
                        response.set("value", value);
                     });

   service.operation("ping", [](rpc::Container&, rpc::Container&, rpc::Context&) {});

   service.validate();
}

int service_main(int argc, char** argv)
{
   Config config;
   auto has_error = false;

   for(int i = 1; i < argc; ++i) {
      string arg = argv[i];
      try {
         if(arg == "-h" || arg == "--help") {
            config.show_help = true;
         } else if(arg == "-a") {
            config.address = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-p") {
            config.port = cli::safe_arg_port(argc, argv, i);
         } else if(arg == "-t") {
            config.n_threads = cli::safe_arg_int(argc, argv, i);
         } else {
            cout << format("unexpected argument: '{}'", arg) << endl;
            has_error = true;
         }
      } catch(std::runtime_error& e) {
         cout << format("Error on command-line: {}", e.what()) << endl;
         has_error = true;
      }
   }

   if(config.show_help) {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   if(config.n_threads < 1) {
      cout << format("thread count must be positive, got {}", config.n_threads) << endl;
      has_error = true;
   }

   if(has_error) {
      cout << format("aborting...") << endl;
      return EXIT_FAILURE;
   }

   logging::set_log_level(logging::LogLevel::INFO);

   auto api           = rpc::ApiConfig::from_string(k_echo_api);
   api.endpoint.port  = config.port;
   auto service       = rpc::Service{std::move(api)};
   register_echo(service);

   net::AsioExecutionContext pool{std::size_t(config.n_threads)};

   net::HttpServer::Config server_config;
   server_config.address       = config.address;
   server_config.port          = config.port;
   server_config.max_body_size = rpc::Service::k_max_body_size;
   server_config.handler       = net::make_service_handler(service);

   auto server = net::HttpServer{pool.io_context(), server_config};
   if(auto ec = server.run(); ec) {
      LOG_ERR("starting echo service: {}", ec.message());
      return EXIT_FAILURE;
   }

   INFO("echo service listening on {}:{}", config.address, server.local_port());

   // Wait for ctrl-c
   boost::asio::signal_set signals{pool.io_context(), SIGINT, SIGTERM};
   signals.async_wait([&](const boost::system::error_code&, int) {
      INFO("shutting down");
      server.shutdown();
      pool.stop();
   });

   pool.run();
   pool.join();
   return EXIT_SUCCESS;
}
} // namespace conduit::example

int main(int argc, char** argv) { return conduit::example::service_main(argc, argv); }
