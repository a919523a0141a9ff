
#include "stdinc.hpp"

#include "client-processor.hpp"

#include "wire-protocol.hpp"

namespace conduit::rpc {

ClientProcessor::ClientProcessor(const Api& api, const Codec& codec, const PluginRegistry& plugins,
                                 const OperationDescriptor& descriptor, net::Transport& transport,
                                 const ExceptionRegistry& exceptions, Container request)
    : Processor{plugins, descriptor}, api_{api}, codec_{codec}, transport_{transport},
      exceptions_{exceptions} {
  request_ = std::move(request);
}

void ClientProcessor::execute() {
  request_body_ = codec_.serialize(request_);
  const auto uri = api_.format_uri(descriptor().name);

  TRACE("POST {} {}", uri, request_body_);
  auto response = transport_.post(uri, request_body_, api_.timeout());
  if (!response) {
    INFO("POST {} failed: {}", uri, response.error().message());
    exceptions_.raise(RequestException::k_name, {response.error().message()});
  }
  if (!response->ok()) {
    INFO("POST {} returned {} {}", uri, response->status, response->reason);
    exceptions_.raise(RequestException::k_name,
                      {fmt::format("{} {}", response->status, response->reason)});
  }

  response_body_ = std::move(response->body);
  try {
    codec_.deserialize(response_body_, response_);
  } catch (const ProtocolError& e) {
    INFO("POST {} returned a malformed body: {}", uri, e.what());
    throw ProtocolError{ecode::invalid_response,
                        fmt::format("malformed response from {}: {}", uri, e.what())};
  }

  if (auto fault = extract_fault(response_)) {
    // Don't leak a partial response
    if (!api_.debug())
      response_.clear();
    exceptions_.raise(fault->cls, std::move(fault->args));
  }
}

} // namespace conduit::rpc
