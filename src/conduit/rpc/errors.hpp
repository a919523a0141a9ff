
#pragma once

#include "value.hpp"

#include "conduit/utils/error-codes.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

/**
 * @defgroup rpc-errors Errors
 * @ingroup conduit-rpc
 *
 * + `ValidationError` Bad description, name, or registration. Thrown during setup, never sent.
 * + `ProtocolError`   Malformed or incomplete wire payload.
 * + `StateError`      Misuse of a `Processor`.
 * + `Fault`           Raised by a handler or plugin; sent over the wire (see `WireFault`).
 * + `RequestException` The builtin `Fault`: transport failure, or the redacted identity.
 */

namespace conduit::rpc {

class FaultType;

// ------------------------------------------------------------------------------------------ Errors

class ValidationError : public std::system_error {
public:
  ValidationError(ecode code, const std::string& what) : std::system_error{code, what} {}
};

class ProtocolError : public std::system_error {
public:
  ProtocolError(ecode code, const std::string& what) : std::system_error{code, what} {}
};

class StateError : public std::system_error {
public:
  StateError(ecode code, const std::string& what) : std::system_error{code, what} {}
};

// ------------------------------------------------------------------------------------------- Fault

/**
 * @brief A named application fault with positional arguments.
 *
 * Handlers throw `Fault{"InsufficientFunds", {balance, requested}}`. On the client, faults
 * are rebuilt from the wire by an `ExceptionRegistry`, and carry the registry's `FaultType`.
 */
class Fault : public std::runtime_error {
private:
  std::shared_ptr<const FaultType> type_;
  std::string name_;
  ValueList args_;

public:
  Fault(std::string name, ValueList args = {});
  Fault(std::shared_ptr<const FaultType> type, ValueList args);

  const std::string& name() const noexcept { return name_; }
  const ValueList& args() const noexcept { return args_; }

  /**
   * @brief The registry type this fault was raised from; null if thrown directly.
   */
  const std::shared_ptr<const FaultType>& type() const noexcept { return type_; }

  bool is(const std::shared_ptr<const FaultType>& type) const noexcept {
    return type_ != nullptr && type_ == type;
  }
};

/**
 * @brief Transport failures on the client, and the identity of redacted faults.
 */
class RequestException : public Fault {
public:
  static constexpr const char* k_name = "RequestException";

  explicit RequestException(ValueList args);
  RequestException(std::shared_ptr<const FaultType> type, ValueList args);
};

/**
 * @brief "Name(arg0, arg1, ...)", used for `what()` and logging.
 */
std::string describe_fault(const std::string& name, const ValueList& args);

} // namespace conduit::rpc
