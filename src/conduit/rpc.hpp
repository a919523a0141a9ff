
#pragma once

/**
 * @defgroup conduit-rpc Rpc
 * @ingroup conduit
 *
 * An api is described once, in json. A `Service` binds a handler to each operation, and a
 * `Client` calls them, over any `net::Transport`. Both run every call through the same
 * pipeline of plugins: request scope, then operation scope, then the handler or remote call.
 */

#include "rpc/client.hpp"
#include "rpc/codec.hpp"
#include "rpc/container.hpp"
#include "rpc/context.hpp"
#include "rpc/description.hpp"
#include "rpc/errors.hpp"
#include "rpc/exception-registry.hpp"
#include "rpc/plugin-registry.hpp"
#include "rpc/service.hpp"
#include "rpc/wire-protocol.hpp"
