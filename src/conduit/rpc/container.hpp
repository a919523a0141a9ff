
#pragma once

#include "value.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace conduit::rpc {

/**
 * @brief Named-field carrier for request and response payloads, and for per-call context.
 *
 * Fields are reachable by index (`c["text"]`) or by name (`c.get("text")`, `c.set("text", v)`);
 * both go through the same underlying map.
 *
 * Reading a missing field returns a null `Value`, and never inserts the field. Writes always
 * succeed, replacing any previous value.
 */
class Container {
public:
  using map_type = std::map<std::string, Value, std::less<>>;
  using const_iterator = map_type::const_iterator;

private:
  map_type fields_;

public:
  Container() = default;
  Container(std::initializer_list<map_type::value_type> fields) : fields_{fields} {}

  const Value& get(std::string_view name) const;
  const Value& operator[](std::string_view name) const { return get(name); }

  /**
   * @brief Sets field `name` to `value`.
   * @return The stored value.
   */
  Value& set(std::string_view name, Value value);

  bool contains(std::string_view name) const;
  std::size_t erase(std::string_view name);
  void clear() noexcept { fields_.clear(); }

  /**
   * @brief Copies every field of `other` into this container, replacing existing values.
   */
  void update(const Container& other);

  std::size_t size() const noexcept { return fields_.size(); }
  bool empty() const noexcept { return fields_.empty(); }

  const_iterator begin() const noexcept { return fields_.begin(); }
  const_iterator end() const noexcept { return fields_.end(); }

  /**
   * @brief This container as a json object.
   */
  Value to_value() const;

  bool operator==(const Container& o) const { return fields_ == o.fields_; }
  bool operator!=(const Container& o) const { return !(*this == o); }
};

} // namespace conduit::rpc
