
#pragma once

#include <string_view>

namespace conduit::example
{
// Shared by echo-service_ex.cpp and echo-client_ex.cpp
constexpr std::string_view k_echo_api = R"({
   "name": "echo",
   "version": "1",
   "endpoint": {
      "scheme": "http",
      "host": "localhost",
      "port": 8080,
      "pattern": "/api/{version}/{operation}"
   },
   "timeout": 2,
   "exceptions": [ "EchoTooLong" ],
   "operations": [
      { "name": "echo", "input": [ "value" ], "output": [ "value" ] },
      "ping"
   ]
})";

constexpr std::size_t k_max_echo_length = 1024;

} // namespace conduit::example
