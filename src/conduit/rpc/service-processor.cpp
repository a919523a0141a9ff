
#include "stdinc.hpp"

#include "service-processor.hpp"

#include "errors.hpp"
#include "wire-protocol.hpp"

namespace conduit::rpc {

ServiceProcessor::ServiceProcessor(const Api& api, const Codec& codec,
                                   const PluginRegistry& plugins,
                                   const OperationDescriptor& descriptor, const Handler* handler,
                                   std::string request_body)
    : Processor{plugins, descriptor}, api_{api}, codec_{codec}, handler_{handler} {
  request_body_ = std::move(request_body);
}

void ServiceProcessor::run() {
  try {
    Processor::run();
    // A request plugin may end the call before OPERATION scope is reached
    if (!is_serialized_)
      serialize_response_();
  } catch (...) {
    marshal_fault_(std::current_exception());
  }
}

void ServiceProcessor::execute() {
  if (handler_ == nullptr || !*handler_)
    throw ValidationError{ecode::missing_handler,
                          fmt::format("no handler for operation '{}'", descriptor().name)};
  (*handler_)(request_, response_, context_);
}

void ServiceProcessor::enter_scope(Scope scope) {
  if (scope == Scope::OPERATION)
    codec_.deserialize(request_body_, request_);
}

void ServiceProcessor::exit_scope(Scope scope) {
  if (scope == Scope::OPERATION)
    serialize_response_();
}

void ServiceProcessor::serialize_response_() {
  response_body_ = codec_.serialize(response_);
  is_serialized_ = true;
}

void ServiceProcessor::marshal_fault_(std::exception_ptr eptr) {
  auto fault = describe_exception(eptr);
  if (!api_.is_whitelisted(fault.cls) && !api_.debug()) {
    WARN("call to '{}' raised {}, sending {}", descriptor().name,
         describe_fault(fault.cls, fault.args), k_generic_fault_name);
    fault = WireFault::generic();
  } else {
    LOG_DEBUG("call to '{}' raised {}", descriptor().name, describe_fault(fault.cls, fault.args));
  }

  // exit_scope(OPERATION) may already have serialized a partial response
  embed_fault(response_, fault);
  serialize_response_();
}

} // namespace conduit::rpc
