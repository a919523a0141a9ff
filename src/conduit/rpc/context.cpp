
#include "stdinc.hpp"

#include "context.hpp"

#include "processor.hpp"

namespace conduit::rpc {

void Context::next() { processor_->continue_from_plugin_(); }

const OperationDescriptor& Context::descriptor() const { return processor_->descriptor(); }

const std::string& Context::response_body() const { return processor_->response_body(); }

} // namespace conduit::rpc
