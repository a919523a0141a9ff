
#include "stdinc.hpp"

#include "container.hpp"

namespace conduit::rpc {

const Value& Container::get(std::string_view name) const {
  static const Value null_value{};
  const auto ii = fields_.find(name);
  return (ii == fields_.end()) ? null_value : ii->second;
}

Value& Container::set(std::string_view name, Value value) {
  const auto ii = fields_.find(name);
  if (ii != fields_.end()) {
    ii->second = std::move(value);
    return ii->second;
  }
  return fields_.emplace(std::string{name}, std::move(value)).first->second;
}

bool Container::contains(std::string_view name) const { return fields_.find(name) != fields_.end(); }

std::size_t Container::erase(std::string_view name) {
  const auto ii = fields_.find(name);
  if (ii == fields_.end())
    return 0;
  fields_.erase(ii);
  return 1;
}

void Container::update(const Container& other) {
  for (const auto& [key, value] : other.fields_)
    fields_.insert_or_assign(key, value);
}

Value Container::to_value() const {
  auto out = Value::object();
  for (const auto& [key, value] : fields_)
    out[key] = value;
  return out;
}

} // namespace conduit::rpc
