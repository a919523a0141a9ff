
#pragma once

#include "errors.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace conduit::rpc {

// --------------------------------------------------------------------------------------- FaultType

/**
 * @brief A named kind of fault, which knows how to throw itself.
 *
 * User-defined types throw `Fault`. Builtin types throw the real C++ exception that has the same
 * name: `RequestException` throws `rpc::RequestException`, `invalid_argument` throws
 * `std::invalid_argument`, and so on.
 */
class FaultType : public std::enable_shared_from_this<FaultType> {
public:
  using ThrowerType =
      std::function<void(std::shared_ptr<const FaultType> type, ValueList args)>;

private:
  std::string name_;
  bool is_builtin_{false};
  ThrowerType thrower_;

public:
  FaultType(std::string name, bool is_builtin, ThrowerType thrower)
      : name_{std::move(name)}, is_builtin_{is_builtin}, thrower_{std::move(thrower)} {}

  const std::string& name() const noexcept { return name_; }
  bool is_builtin() const noexcept { return is_builtin_; }

  /**
   * @brief Throws an instance of this type, built from `args`.
   */
  [[noreturn]] void raise(ValueList args) const;
};

using FaultTypePtr = std::shared_ptr<const FaultType>;

// ------------------------------------------------------------------------------- ExceptionRegistry

/**
 * @brief Per-instance cache of fault types, by name.
 *
 * `get` returns the identical `FaultType` for a given name for the lifetime of the registry.
 * Types for user-defined names are created lazily, and are private to the registry; two
 * registries give out distinct types for the same name. Builtin names resolve to one
 * process-wide type.
 *
 * Safe to call from several threads.
 */
class ExceptionRegistry {
private:
  mutable std::mutex padlock_;
  mutable std::map<std::string, FaultTypePtr, std::less<>> types_;

public:
  ExceptionRegistry() = default;
  ExceptionRegistry(const ExceptionRegistry&) = delete;
  ExceptionRegistry& operator=(const ExceptionRegistry&) = delete;

  FaultTypePtr get(std::string_view name) const;

  [[noreturn]] void raise(std::string_view name, ValueList args) const {
    get(name)->raise(std::move(args));
  }

  /**
   * @brief Number of user-defined types created so far.
   */
  std::size_t size() const;

  static bool is_builtin(std::string_view name);
};

} // namespace conduit::rpc
