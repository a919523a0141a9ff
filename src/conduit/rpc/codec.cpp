
#include "stdinc.hpp"

#include "codec.hpp"

#include "errors.hpp"

namespace conduit::rpc {

std::string JsonCodec::serialize(const Container& container) const {
  return container.to_value().dump(-1, ' ', false, Value::error_handler_t::replace);
}

void JsonCodec::deserialize(std::string_view text, Container& container) const {
  auto document = Value::parse(text, nullptr, false);
  if (document.is_discarded())
    throw ProtocolError{ecode::invalid_data, "payload is not valid json"};
  if (!document.is_object())
    throw ProtocolError{ecode::invalid_data,
                        fmt::format("payload must be a json object, got a {}",
                                    document.type_name())};

  Container out;
  for (auto ii = document.begin(); ii != document.end(); ++ii)
    out.set(ii.key(), std::move(ii.value()));
  container = std::move(out);
}

std::shared_ptr<const Codec> make_json_codec() { return std::make_shared<const JsonCodec>(); }

} // namespace conduit::rpc
