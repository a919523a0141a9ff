
#include "stdinc.hpp"

#include "description.hpp"

#include "conduit/utils/string-utils.hpp"

#include <charconv>
#include <cmath>

namespace conduit::rpc {

namespace {

  constexpr std::string_view k_operation_placeholder = "{operation}";
  constexpr std::string_view k_version_placeholder = "{version}";

  /// @private
  [[noreturn]] void bad_description(const std::string& message) {
    throw ValidationError{ecode::bad_description, message};
  }

  /// @private
  std::string string_field(const Value& value, std::string_view what) {
    if (value.is_null())
      return {};
    if (!value.is_string())
      bad_description(fmt::format("'{}' must be a string, got: {}", what, value.dump()));
    return value.get<std::string>();
  }

  /// @private
  std::vector<std::string> name_list(const Value& value, std::string_view what) {
    std::vector<std::string> out;
    if (value.is_null())
      return out;
    if (!value.is_array())
      bad_description(fmt::format("'{}' must be a list of names, got: {}", what, value.dump()));
    out.reserve(value.size());
    for (const auto& item : value) {
      auto name = string_field(item, what);
      validate_name(name);
      if (std::find(cbegin(out), cend(out), name) != cend(out))
        bad_description(fmt::format("duplicate name '{}' in '{}'", name, what));
      out.push_back(std::move(name));
    }
    return out;
  }

  /// @private
  std::optional<uint16_t> port_field(const Value& value) {
    if (value.is_null())
      return std::nullopt;

    if (value.is_number_integer()) {
      const auto port = value.get<int64_t>();
      if (port >= 0 && port <= std::numeric_limits<uint16_t>::max())
        return static_cast<uint16_t>(port);
    } else if (value.is_string()) {
      const auto& s = value.get_ref<const std::string&>();
      uint16_t port = 0;
      const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), port);
      if (!s.empty() && ec == std::errc{} && ptr == s.data() + s.size())
        return port;
    }

    throw ValidationError{ecode::bad_endpoint, fmt::format("invalid port: {}", value.dump())};
  }

  /// @private
  std::chrono::milliseconds timeout_field(const Value& value) {
    if (!value.is_number() || value.get<double>() < 0.0 || !std::isfinite(value.get<double>()))
      bad_description(fmt::format("'timeout' must be a non-negative number of seconds, got: {}",
                                  value.dump()));
    return std::chrono::milliseconds{std::llround(value.get<double>() * 1000.0)};
  }

  /// @private
  void load_endpoint(const Value& value, Endpoint& endpoint) {
    if (!value.is_object())
      bad_description(fmt::format("'endpoint' must be an object, got: {}", value.dump()));
    for (const auto& [key, item] : value.items()) {
      if (key == "scheme")
        endpoint.scheme = string_field(item, "endpoint.scheme");
      else if (key == "host")
        endpoint.host = string_field(item, "endpoint.host");
      else if (key == "port")
        endpoint.port = port_field(item);
      else if (key == "pattern")
        endpoint.pattern = string_field(item, "endpoint.pattern");
      else
        endpoint.metadata[key] = item;
    }
  }

  /// @private
  void add_operation(ApiConfig& config, OperationDescriptor op) {
    const auto name = op.name;
    if (!config.operations.emplace(name, std::move(op)).second)
      bad_description(fmt::format("operation '{}' is described twice", name));
  }

  /// @private
  void load_operations(const Value& value, ApiConfig& config) {
    if (value.is_array()) {
      for (const auto& item : value)
        add_operation(config, OperationDescriptor::from_description(item));
    } else if (value.is_object()) {
      // {"upper": {"input": [...]}, ...}
      for (const auto& [key, item] : value.items()) {
        auto description = item.is_object() ? item : Value::object();
        if (!description.contains("name"))
          description["name"] = key;
        auto op = OperationDescriptor::from_description(description);
        if (op.name != key)
          bad_description(fmt::format("operation '{}' is named '{}'", key, op.name));
        add_operation(config, std::move(op));
      }
    } else if (!value.is_null()) {
      bad_description(fmt::format("'operations' must be a list, got: {}", value.dump()));
    }
  }

  /// @private
  std::string regex_escape(std::string_view s) {
    static constexpr std::string_view k_special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(s.size() * 2);
    for (const auto c : s) {
      if (k_special.find(c) != std::string_view::npos)
        out += '\\';
      out += c;
    }
    return out;
  }

  /// @private
  std::string substitute_version(std::string pattern, const std::string& version) {
    replace_all(pattern, k_version_placeholder, version);
    return pattern;
  }

  /// @private
  ApiConfig validated(ApiConfig config) {
    for (const auto& [key, op] : config.operations) {
      if (key != op.name)
        throw ValidationError{ecode::bad_description,
                              fmt::format("operation '{}' is stored under '{}'", op.name, key)};
      op.validate();
    }
    for (const auto& name : config.exceptions)
      validate_name(name);
    config.endpoint.pattern = substitute_version(config.endpoint.pattern, config.version);
    return config;
  }

} // namespace

// ------------------------------------------------------------------------------------------- Names

bool is_valid_name(std::string_view name) noexcept {
  auto is_alpha = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); };
  auto is_word = [&](char c) { return is_alpha(c) || (c >= '0' && c <= '9') || c == '_'; };
  if (name.empty() || !is_alpha(name.front()))
    return false;
  return std::all_of(cbegin(name) + 1, cend(name), is_word);
}

void validate_name(std::string_view name) {
  if (!is_valid_name(name))
    throw ValidationError{ecode::invalid_name, fmt::format("invalid name: '{}'", name)};
}

// ----------------------------------------------------------------------------- OperationDescriptor

OperationDescriptor OperationDescriptor::from_description(const Value& description) {
  OperationDescriptor op;
  if (description.is_string()) {
    op.name = description.get<std::string>();
  } else if (description.is_object()) {
    for (const auto& [key, item] : description.items()) {
      if (key == "name")
        op.name = string_field(item, "name");
      else if (key == "input")
        op.input = name_list(item, "input");
      else if (key == "output")
        op.output = name_list(item, "output");
      else
        op.metadata[key] = item;
    }
  } else {
    bad_description(fmt::format("an operation must be a name or an object, got: {}",
                                description.dump()));
  }
  validate_name(op.name);
  return op;
}

void OperationDescriptor::validate() const {
  validate_name(name);
  for (const auto& field : input)
    validate_name(field);
  for (const auto& field : output)
    validate_name(field);
}

// ---------------------------------------------------------------------------------------- Endpoint

std::string make_client_format(const Endpoint& endpoint) {
  auto missing = [](std::string_view part) {
    return ValidationError{ecode::bad_endpoint, fmt::format("endpoint has no {}", part)};
  };
  if (endpoint.scheme.empty())
    throw missing("scheme");
  if (endpoint.host.empty())
    throw missing("host");
  if (!endpoint.port)
    throw missing("port");
  if (endpoint.pattern.empty())
    throw missing("pattern");
  return fmt::format("{}://{}:{}{}", endpoint.scheme, endpoint.host, *endpoint.port,
                     endpoint.pattern);
}

// ------------------------------------------------------------------------------------- PathMatcher

PathMatcher PathMatcher::make(std::string_view pattern) {
  if (pattern.empty())
    throw ValidationError{ecode::bad_endpoint, "endpoint has no pattern"};

  const auto count = count_occurrences(pattern, k_operation_placeholder);
  if (count != 1)
    throw ValidationError{
        ecode::bad_endpoint,
        fmt::format("pattern '{}' must contain exactly one {}, found {}", pattern,
                    k_operation_placeholder, count)};

  const auto pos = pattern.find(k_operation_placeholder);
  const auto prefix = pattern.substr(0, pos);
  auto suffix = pattern.substr(pos + k_operation_placeholder.size());
  if (!suffix.empty() && suffix.back() == '/')
    suffix.remove_suffix(1);

  auto expr = fmt::format("^{}([^/]+){}/?$", regex_escape(prefix), regex_escape(suffix));
  TRACE("path matcher '{}' => '{}'", pattern, expr);
  return PathMatcher{std::string{pattern}, std::regex{expr}};
}

tl::expected<std::string, std::error_code> PathMatcher::match(std::string_view path) const {
  std::match_results<std::string_view::const_iterator> parts;
  if (!std::regex_match(cbegin(path), cend(path), parts, regex_))
    return tl::make_unexpected(make_error_code(ecode::unknown_operation));
  return parts[1].str();
}

// --------------------------------------------------------------------------------------- ApiConfig

ApiConfig ApiConfig::from_description(const Value& description) {
  if (!description.is_object())
    bad_description(fmt::format("an api description must be an object, got: {}",
                                description.dump()));

  auto config = ApiConfig::defaults();
  for (const auto& [key, item] : description.items()) {
    if (key == "name") {
      config.name = string_field(item, "name");
    } else if (key == "version") {
      config.version = item.is_string() ? item.get<std::string>() : item.dump();
    } else if (key == "endpoint") {
      load_endpoint(item, config.endpoint);
    } else if (key == "timeout") {
      config.timeout = timeout_field(item);
    } else if (key == "debug") {
      if (!item.is_boolean())
        bad_description(fmt::format("'debug' must be a boolean, got: {}", item.dump()));
      config.debug = item.get<bool>();
    } else if (key == "exceptions") {
      for (auto& name : name_list(item, "exceptions"))
        config.exceptions.insert(std::move(name));
    } else if (key == "operations") {
      load_operations(item, config);
    } else {
      config.metadata[key] = item;
    }
  }
  return config;
}

ApiConfig ApiConfig::from_string(std::string_view text) {
  const auto description = Value::parse(text, nullptr, false);
  if (description.is_discarded())
    bad_description("api description is not valid json");
  return from_description(description);
}

// --------------------------------------------------------------------------------------------- Api

Api::Api(ApiConfig config)
    : config_{validated(std::move(config))}, matcher_{PathMatcher::make(config_.endpoint.pattern)} {
  try {
    client_format_ = make_client_format(config_.endpoint);
  } catch (const ValidationError& e) {
    client_format_ = tl::make_unexpected(std::string{e.what()});
  }
}

const std::string& Api::client_format() const {
  if (!client_format_.has_value())
    throw ValidationError{ecode::bad_endpoint, client_format_.error()};
  return client_format_.value();
}

std::string Api::format_uri(std::string_view operation) const {
  auto uri = client_format();
  replace_all(uri, k_operation_placeholder, operation);
  return uri;
}

const OperationDescriptor* Api::find_operation(std::string_view operation) const {
  const auto ii = config_.operations.find(operation);
  return (ii == config_.operations.end()) ? nullptr : &ii->second;
}

bool Api::is_whitelisted(std::string_view fault_name) const {
  return config_.exceptions.find(fault_name) != config_.exceptions.end();
}

} // namespace conduit::rpc
