
#pragma once

#include "errors.hpp"
#include "value.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

/**
 * @defgroup rpc-description Api Description
 * @ingroup conduit-rpc
 *
 * An api is described once, in json, and shared by a `Service` and its `Client`s:
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.json}
 * { "name": "text",
 *   "endpoint": { "scheme": "http", "host": "localhost", "port": 8080,
 *                 "pattern": "/api/{version}/{operation}" },
 *   "timeout": 2.5,
 *   "exceptions": [ "TextTooLong" ],
 *   "operations": [ { "name": "upper", "input": [ "text" ], "output": [ "result" ] },
 *                   "ping" ] }
 * ~~~~~~~~~~~~~~~~~~~~~~
 *
 * Keys that are not understood are kept, verbatim, in the `metadata` of the enclosing object.
 */

namespace conduit::rpc {

// ------------------------------------------------------------------------------------------- Names

/**
 * @brief True iff `name` matches `^[A-Za-z]\w*$`
 */
bool is_valid_name(std::string_view name) noexcept;

/**
 * @brief Throws `ValidationError{ecode::invalid_name}` if `!is_valid_name(name)`
 */
void validate_name(std::string_view name);

// ----------------------------------------------------------------------------- OperationDescriptor

struct OperationDescriptor {
  std::string name;
  std::vector<std::string> input;  //!< Request fields, in call order.
  std::vector<std::string> output; //!< Response fields, in result order.
  Value metadata = Value::object();

  /**
   * @brief From `"name"`, or `{"name": ..., "input": [...], "output": [...], ...}`
   */
  static OperationDescriptor from_description(const Value& description);

  void validate() const;
};

// ---------------------------------------------------------------------------------------- Endpoint

struct Endpoint {
  std::string scheme;
  std::string host;
  std::optional<uint16_t> port;
  std::string pattern; //!< Must contain exactly one `{operation}`
  Value metadata = Value::object();
};

/**
 * @brief `"{scheme}://{host}:{port}{pattern}"`, with `{operation}` left in place.
 * @throws ValidationError if any part of the endpoint is missing.
 */
std::string make_client_format(const Endpoint& endpoint);

// ------------------------------------------------------------------------------------- PathMatcher

/**
 * @brief Matches inbound request paths, and extracts the operation name.
 *
 * `"/api/{operation}/suffix"` matches `"/api/foo/suffix"` and `"/api/foo/suffix/"`, giving
 * `"foo"`.
 */
class PathMatcher {
private:
  std::string pattern_;
  std::regex regex_;

  PathMatcher(std::string pattern, std::regex regex)
      : pattern_{std::move(pattern)}, regex_{std::move(regex)} {}

public:
  /**
   * @throws ValidationError if `pattern` is empty, or has other than one `{operation}`
   */
  static PathMatcher make(std::string_view pattern);

  tl::expected<std::string, std::error_code> match(std::string_view path) const;

  const std::string& pattern() const noexcept { return pattern_; }
};

// --------------------------------------------------------------------------------------- ApiConfig

/**
 * @brief Plain, copyable description of an api.
 *
 * Every instance carries its own copy of the defaults; changing one never affects another.
 */
struct ApiConfig {
  std::string name;
  std::string version = "0";
  Endpoint endpoint = {"https", "localhost", 8080, "/api/{operation}"};
  std::chrono::milliseconds timeout = std::chrono::milliseconds{2000};
  bool debug = false;
  std::set<std::string, std::less<>> exceptions; //!< Whitelist of fault names
  std::map<std::string, OperationDescriptor, std::less<>> operations;
  Value metadata = Value::object();

  static ApiConfig defaults() { return ApiConfig{}; }

  /**
   * @brief Merges `description` over the defaults.
   * @throws ValidationError if the description is malformed.
   */
  static ApiConfig from_description(const Value& description);

  /**
   * @brief Parses `text` as json, and calls `from_description`.
   */
  static ApiConfig from_string(std::string_view text);
};

// --------------------------------------------------------------------------------------------- Api

/**
 * @brief An `ApiConfig` that has been validated, and compiled for dispatch.
 *
 * Immutable, and safe to share between threads.
 */
class Api {
private:
  ApiConfig config_;
  PathMatcher matcher_;
  tl::expected<std::string, std::string> client_format_;

public:
  explicit Api(ApiConfig config);

  const ApiConfig& config() const noexcept { return config_; }
  const std::string& name() const noexcept { return config_.name; }
  std::chrono::milliseconds timeout() const noexcept { return config_.timeout; }
  bool debug() const noexcept { return config_.debug; }

  const PathMatcher& matcher() const noexcept { return matcher_; }

  /**
   * @brief The client format string.
   * @throws ValidationError if the endpoint cannot produce one.
   */
  const std::string& client_format() const;

  /**
   * @brief The uri for calling `operation`.
   */
  std::string format_uri(std::string_view operation) const;

  /**
   * @return nullptr if `operation` is not described.
   */
  const OperationDescriptor* find_operation(std::string_view operation) const;

  bool is_whitelisted(std::string_view fault_name) const;
};

} // namespace conduit::rpc
