
#pragma once

#include "conduit/net/asio-execution-context.hpp"
#include "conduit/net/http-server.hpp"
#include "conduit/net/http-transport.hpp"
#include "conduit/net/loopback-transport.hpp"
#include "conduit/net/transport.hpp"
