
#pragma once

#include "container.hpp"

#include <array>
#include <atomic>
#include <functional>
#include <mutex>
#include <string_view>
#include <variant>
#include <vector>

namespace conduit::rpc {

class Context;

/**
 * @brief Successive phases of a call: request plugins, then operation plugins, then the handler
 *        (or remote call).
 */
enum class Scope : int { REQUEST = 0, OPERATION, FUNCTION, DONE };

std::string_view str(Scope scope) noexcept;

/**
 * @brief A request-scope plugin. Call `context.next()` to continue the pipeline.
 */
using RequestPlugin = std::function<void(Context& context)>;

/**
 * @brief An operation-scope plugin, which sees the request and response after deserialization.
 */
using OperationPlugin =
    std::function<void(Container& request, Container& response, Context& context)>;

using Plugin = std::variant<RequestPlugin, OperationPlugin>;

/**
 * @brief Plugins of a service or client, bucketed by scope, in registration order.
 *
 * Append-only until `finalize()`, which the owner calls before it processes its first call.
 * After that, the registry is read without locks from any number of concurrent calls.
 */
class PluginRegistry {
private:
  std::vector<RequestPlugin> request_plugins_;
  std::vector<OperationPlugin> operation_plugins_;
  mutable std::mutex padlock_;
  std::once_flag finalize_flag_;
  std::atomic<bool> is_finalized_{false};

public:
  PluginRegistry() = default;
  PluginRegistry(const PluginRegistry&) = delete;
  PluginRegistry& operator=(const PluginRegistry&) = delete;

  /**
   * @throws ValidationError `invalid_scope` if the plugin's signature does not fit `scope`, or
   *         `registry_finalized` if the registry is finalized. Nothing is appended in either case.
   */
  void add(Scope scope, Plugin plugin);

  /**
   * @brief Closes the registry to further `add`s. Idempotent, and safe to race.
   */
  void finalize();

  bool is_finalized() const noexcept { return is_finalized_.load(std::memory_order_acquire); }

  /**
   * @brief The number of plugins in `scope`; zero for `FUNCTION` and `DONE`.
   */
  std::size_t size(Scope scope) const noexcept;

  const RequestPlugin& request_plugin(std::size_t index) const { return request_plugins_.at(index); }
  const OperationPlugin& operation_plugin(std::size_t index) const {
    return operation_plugins_.at(index);
  }
};

} // namespace conduit::rpc
