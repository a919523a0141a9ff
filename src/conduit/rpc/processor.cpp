
#include "stdinc.hpp"

#include "processor.hpp"

#include "errors.hpp"

#include <optional>

namespace conduit::rpc {

namespace {

  /// @private
  template <typename T> struct PopOnExit {
    std::vector<T>& stack;
    ~PopOnExit() { stack.pop_back(); }
  };

  /// @private
  Scope next_scope(Scope scope) {
    switch (scope) {
    case Scope::REQUEST: return Scope::OPERATION;
    case Scope::OPERATION: return Scope::FUNCTION;
    default: return Scope::DONE;
    }
  }

} // namespace

Processor::Processor(const PluginRegistry& plugins, const OperationDescriptor& descriptor)
    : plugins_{plugins}, descriptor_{descriptor},
      context_{observer_ptr<Processor>{this}, descriptor.name} {}

void Processor::process() {
  if (started_)
    throw StateError{ecode::already_processed,
                     fmt::format("call to '{}' was already processed", descriptor_.name)};
  started_ = true;

  TRACE("processing '{}'", descriptor_.name);
  try {
    run();
  } catch (...) {
    state_ = Scope::DONE;
    throw;
  }
  state_ = Scope::DONE;
}

void Processor::continue_execution_() {
  std::optional<Scope> entered;
  if (index_ == -1) {
    entered = state_;
    enter_scope(state_);
  }

  if (state_ == Scope::FUNCTION) {
    frames_.push_back(Frame::TERMINAL);
    {
      PopOnExit<Frame> pop{frames_};
      execute();
    }
    state_ = Scope::DONE;
  } else if (state_ == Scope::REQUEST || state_ == Scope::OPERATION) {
    advance_();
  }

  if (entered)
    exit_scope(*entered);
}

void Processor::advance_() {
  ++index_;
  const auto n_plugins = static_cast<int>(plugins_.size(state_));

  if (index_ < n_plugins) {
    dispatch_();
  } else if (index_ == n_plugins) {
    state_ = next_scope(state_);
    index_ = -1;
    continue_execution_();
  } else {
    throw StateError{ecode::logic_error,
                     fmt::format("plugin index {} is past the end of scope '{}'", index_,
                                 str(state_))};
  }
}

void Processor::dispatch_() {
  const auto index = static_cast<std::size_t>(index_);
  const auto scope = state_;

  frames_.push_back(Frame::ACTIVE);
  PopOnExit<Frame> pop{frames_};
  if (scope == Scope::REQUEST)
    plugins_.request_plugin(index)(context_);
  else
    plugins_.operation_plugin(index)(request_, response_, context_);
}

void Processor::continue_from_plugin_() {
  if (frames_.empty() || frames_.back() != Frame::ACTIVE) {
    const auto where = frames_.empty()                      ? "outside of a plugin"
                       : (frames_.back() == Frame::TERMINAL) ? "from inside the handler"
                                                             : "twice by one plugin";
    throw StateError{ecode::continuation_reused,
                     fmt::format("next() called {}, in call to '{}'", where, descriptor_.name)};
  }
  frames_.back() = Frame::CONTINUED;
  continue_execution_();
}

} // namespace conduit::rpc
