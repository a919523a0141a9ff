
#pragma once

#include "container.hpp"

#include "conduit/utils/base/pointer.hpp"

#include <string>

namespace conduit::rpc {

class Processor;
struct OperationDescriptor;

/**
 * @brief Per-call context handed to every plugin, and to the handler.
 *
 * A plugin continues the pipeline by calling `next()` exactly once. Work done before `next()`
 * runs before later plugins, and work done after it returns runs after them. A plugin that
 * does not call `next()` ends the call there.
 */
class Context {
private:
  observer_ptr<Processor> processor_;
  std::string operation_;
  Container values_;

public:
  Context(observer_ptr<Processor> processor, std::string operation)
      : processor_{processor}, operation_{std::move(operation)} {}

  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  /**
   * @brief Runs the rest of the pipeline, and returns when it has finished.
   * @throws StateError `continuation_reused` if the calling plugin already called `next()`, or
   *         if no plugin is running (i.e., from inside the handler).
   */
  void next();

  const std::string& operation() const noexcept { return operation_; }
  const OperationDescriptor& descriptor() const;

  /**
   * @brief The serialized response, once operation scope has finished; empty before then.
   */
  const std::string& response_body() const;

  /**
   * @brief Scratch values shared by the plugins and handler of this one call.
   */
  Container& values() noexcept { return values_; }
  const Container& values() const noexcept { return values_; }
};

} // namespace conduit::rpc
