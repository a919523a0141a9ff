
#pragma once

#include "container.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace conduit::rpc {

/**
 * @brief Converts between wire text and a `Container`.
 */
class Codec {
public:
  virtual ~Codec() = default;

  virtual std::string serialize(const Container& container) const = 0;

  /**
   * @brief Replaces the contents of `container` with the fields in `text`.
   * @throws ProtocolError `invalid_data` if `text` is malformed; `container` is unchanged.
   */
  virtual void deserialize(std::string_view text, Container& container) const = 0;

  virtual std::string_view content_type() const noexcept = 0;
};

/**
 * @brief A flat json object: `{"field": value, ...}`
 */
class JsonCodec final : public Codec {
public:
  std::string serialize(const Container& container) const override;
  void deserialize(std::string_view text, Container& container) const override;
  std::string_view content_type() const noexcept override { return "application/json"; }
};

std::shared_ptr<const Codec> make_json_codec();

} // namespace conduit::rpc
