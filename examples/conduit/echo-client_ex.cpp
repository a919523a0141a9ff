
#include "stdinc.hpp"

#include "echo-api.hpp"

#include "conduit/net.hpp"
#include "conduit/rpc.hpp"
#include "conduit/utils.hpp"

namespace conduit::example
{
struct Config
{
   bool show_help{false};
   string host{"localhost"};
   uint16_t port{8080};
   string message{"Hello World!"};
   int timeout_ms{2000};
   logging::LogLevel log_level{logging::LogLevel::WARN};
};

static void show_help(const char* exec)
{
   cout << format(R"(

   Usage: {} [-H <host>] [-p <port>] [-m <message>] [-t <timeout-ms>] [-l <log-level>]

      Calls "echo" on the echo service, and prints the result.

)",
                  exec);
}

int client_main(int argc, char** argv)
{
   Config config;
   auto has_error = false;

   for(int i = 1; i < argc; ++i) {
      string arg = argv[i];
      try {
         if(arg == "-h" || arg == "--help") {
            config.show_help = true;
         } else if(arg == "-H") {
            config.host = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-p") {
            config.port = cli::safe_arg_port(argc, argv, i);
         } else if(arg == "-m") {
            config.message = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-t") {
            config.timeout_ms = cli::safe_arg_int(argc, argv, i);
         } else if(arg == "-l") {
            const auto name = cli::safe_arg_str(argc, argv, i);
            if(!logging::parse_log_level(name, config.log_level)) {
               cout << format("unknown log level: '{}'", name) << endl;
               has_error = true;
            }
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

   if(has_error) {
      cout << format("aborting...") << endl;
      return EXIT_FAILURE;
   }

   logging::set_log_level(config.log_level);

   auto api          = rpc::ApiConfig::from_string(k_echo_api);
   api.endpoint.host = config.host;
   api.endpoint.port = config.port;
   api.timeout       = std::chrono::milliseconds{config.timeout_ms};

   auto client = rpc::Client{std::move(api), std::make_shared<net::HttpTransport>()};

   try {
      client.call("ping");
      const auto result = client.call("echo", {config.message});
      cout << result.dump() << endl;
   } catch(rpc::Fault& e) {
      cout << format("echo failed: {}", e.what()) << endl;
      return EXIT_FAILURE;
   } catch(std::exception& e) {
      cout << format("error: {}", e.what()) << endl;
      return EXIT_FAILURE;
   }

   return EXIT_SUCCESS;
}
} // namespace conduit::example

int main(int argc, char** argv) { return conduit::example::client_main(argc, argv); }
