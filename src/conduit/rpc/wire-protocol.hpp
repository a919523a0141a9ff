
#pragma once

#include "container.hpp"
#include "errors.hpp"

#include <exception>
#include <optional>
#include <string>
#include <string_view>

/**
 * @defgroup rpc-wire Wire Protocol
 * @ingroup conduit-rpc
 *
 * A failed call answers with exactly one field:
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.json}
 * {"__exception__": {"cls": "InsufficientFunds", "args": [10, 25]}}
 * ~~~~~~~~~~~~~~~~~~~~~~
 *
 * Faults that are neither whitelisted, nor sent in debug mode, go out as
 * `{"cls": "RequestException", "args": [500]}`.
 */

namespace conduit::rpc {

constexpr std::string_view k_exception_key = "__exception__";
constexpr std::string_view k_generic_fault_name = "RequestException";
constexpr int k_generic_fault_status = 500;

struct WireFault {
  std::string cls;
  ValueList args;

  /**
   * @brief The identity of a redacted fault.
   */
  static WireFault generic() { return {std::string{k_generic_fault_name}, {k_generic_fault_status}}; }

  Value to_value() const;

  /**
   * @throws ProtocolError `invalid_response` unless `value` is `{"cls": string, "args": list}`
   */
  static WireFault from_value(const Value& value);

  bool operator==(const WireFault&) const = default;
};

/**
 * @brief The wire name and args of an in-flight exception.
 *
 * `Fault`s give their own name and args. Any other `std::exception` gives the unqualified name
 * of its dynamic type, such as `invalid_argument` or `TextTooLong`, with `[what()]`. Anything
 * else is `exception`.
 */
WireFault describe_exception(std::exception_ptr eptr);

/**
 * @brief The fault carried by `response`, if any.
 * @throws ProtocolError if the reserved key is present, but malformed.
 */
std::optional<WireFault> extract_fault(const Container& response);

/**
 * @brief Replaces the whole of `response` with the reserved fault field.
 */
void embed_fault(Container& response, const WireFault& fault);

} // namespace conduit::rpc
