
#pragma once

#include <nlohmann/json.hpp>

#include <vector>

namespace conduit::rpc {

/**
 * @brief A field value, or a fault argument: null, bool, number, string, array or object.
 */
using Value = nlohmann::json;

using ValueList = std::vector<Value>;

} // namespace conduit::rpc
