
#include "stdinc.hpp"

#include "client.hpp"

#include "client-processor.hpp"

namespace conduit::rpc {

Client::Client(ApiConfig config, std::shared_ptr<net::Transport> transport,
               std::shared_ptr<const Codec> codec)
    : api_{std::move(config)}, transport_{std::move(transport)}, codec_{std::move(codec)} {
  if (transport_ == nullptr || codec_ == nullptr)
    throw ValidationError{ecode::argument_error, "client requires a transport and a codec"};
  [[maybe_unused]] const auto& format = api_.client_format(); // throws if incomplete
  TRACE("client of '{}' calls {}", api_.name(), format);
}

void Client::plugin(Scope scope, Plugin plugin) { plugins_.add(scope, std::move(plugin)); }

Value Client::call(std::string_view operation, ValueList args) {
  const auto descriptor = api_.find_operation(operation);
  if (descriptor == nullptr)
    throw ValidationError{ecode::unknown_operation,
                          fmt::format("'{}' is not an operation of api '{}'", operation,
                                      api_.name())};

  if (args.size() != descriptor->input.size())
    throw ValidationError{ecode::argument_error,
                          fmt::format("'{}' takes {} arguments, {} given", operation,
                                      descriptor->input.size(), args.size())};

  Container request;
  for (std::size_t i = 0; i < args.size(); ++i)
    request.set(descriptor->input[i], std::move(args[i]));

  const auto response = call_fields(operation, std::move(request));

  const auto& output = descriptor->output;
  if (output.empty())
    return Value{};
  if (output.size() == 1)
    return response[output.front()];

  auto out = Value::array();
  for (const auto& field : output)
    out.push_back(response[field]);
  return out;
}

Container Client::call_fields(std::string_view operation, Container request) {
  const auto descriptor = api_.find_operation(operation);
  if (descriptor == nullptr)
    throw ValidationError{ecode::unknown_operation,
                          fmt::format("'{}' is not an operation of api '{}'", operation,
                                      api_.name())};

  plugins_.finalize();

  ClientProcessor processor{api_,        *codec_,     plugins_,          *descriptor,
                            *transport_, exceptions_, std::move(request)};
  processor.process();
  return processor.take_result();
}

} // namespace conduit::rpc
