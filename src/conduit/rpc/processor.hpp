
#pragma once

#include "container.hpp"
#include "context.hpp"
#include "description.hpp"
#include "plugin-registry.hpp"

#include <string>
#include <vector>

namespace conduit::rpc {

/**
 * @brief Drives one call through its plugins, and then its terminal action.
 *
 * The call moves through `REQUEST` -> `OPERATION` -> `FUNCTION` -> `DONE`. Plugins of a scope
 * run in registration order, each one nested inside the `next()` of the one before it. When a
 * scope runs out of plugins, the next scope starts inside that same `next()`; `FUNCTION` runs
 * `execute()` exactly once.
 *
 * `enter_scope(s)` is called on first entry to scope `s`, and `exit_scope(s)` once everything
 * nested inside `s` has returned. So `exit_scope(OPERATION)` happens before the "after" half of
 * every request plugin.
 *
 * Single use: a second `process()` throws `StateError`.
 */
class Processor {
private:
  enum class Frame : int {
    ACTIVE,    //!< plugin is running, and has not called `next()`
    CONTINUED, //!< plugin already called `next()`
    TERMINAL   //!< `execute()` is running
  };

  const PluginRegistry& plugins_;
  const OperationDescriptor& descriptor_;
  Scope state_{Scope::REQUEST};
  int index_{-1};
  bool started_{false};
  std::vector<Frame> frames_;

  void advance_();
  void dispatch_();

  friend class Context;
  void continue_from_plugin_();

protected:
  Context context_;
  Container request_;
  Container response_;
  std::string request_body_;
  std::string response_body_;

  /**
   * @brief Runs the scope state machine from the current position.
   */
  void continue_execution_();

  /**
   * @brief The terminal action: invoke the handler, or make the remote call.
   */
  virtual void execute() = 0;

  virtual void enter_scope(Scope) {}
  virtual void exit_scope(Scope) {}

  /**
   * @brief Called once by `process()`; override to wrap the whole pipeline.
   */
  virtual void run() { continue_execution_(); }

public:
  Processor(const PluginRegistry& plugins, const OperationDescriptor& descriptor);
  virtual ~Processor() = default;

  Processor(const Processor&) = delete;
  Processor& operator=(const Processor&) = delete;

  /**
   * @brief Runs the call. The processor is `DONE` afterwards, whether the pipeline completed,
   *        short-circuited, or threw.
   * @throws StateError `already_processed` on the second invocation.
   */
  void process();

  Scope state() const noexcept { return state_; }
  const OperationDescriptor& descriptor() const noexcept { return descriptor_; }
  const Context& context() const noexcept { return context_; }

  const Container& request() const noexcept { return request_; }
  const Container& response() const noexcept { return response_; }
  const std::string& request_body() const noexcept { return request_body_; }
  const std::string& response_body() const noexcept { return response_body_; }
};

} // namespace conduit::rpc
