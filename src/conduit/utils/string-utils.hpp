
#pragma once

#include <range/v3/range/concepts.hpp>

#include <cctype>
#include <string>
#include <string_view>

/**
 * @defgroup conduit-strings Strings
 * @ingroup conduit-utils
 */
namespace conduit {
// -------------------------------------------------------------- To Upper/Lower
/**
 * @ingroup conduit-strings
 * @brief converts `s` to uppercase inplace.
 */
template <class Range>
requires ranges::range<Range>
constexpr Range to_upper(Range r) {
  for (auto& c : r)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return r;
}

/**
 * @ingroup conduit-strings
 * @brief converts `s` to lowercase inplace.
 */
template <class Range>
requires ranges::range<Range>
constexpr Range to_lower(Range r) {
  for (auto& c : r)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return r;
}

/**
 * @ingroup conduit-strings
 * @brief copies and converts `s` to uppercase.
 */
template <typename string_type> constexpr string_type to_upper_copy(const string_type& s) {
  return to_upper(string_type{s});
}

/**
 * @ingroup conduit-strings
 * @brief copies and converts `s` to lowercase
 */
template <typename string_type> constexpr string_type to_lower_copy(const string_type& s) {
  return to_lower(string_type{s});
}

// ----------------------------------------------------------------- Replace All

/**
 * @ingroup conduit-strings
 * @brief Replace every (non-overlapping) occurrence of `from` in `s` with `to`.
 * @return The number of replacements made.
 */
std::size_t replace_all(std::string& s, std::string_view from, std::string_view to);

/**
 * @ingroup conduit-strings
 * @brief The number of (non-overlapping) occurrences of `needle` in `s`.
 */
std::size_t count_occurrences(std::string_view s, std::string_view needle);

// ------------------------------------------------------------------------ Trim

std::string& ltrim(std::string& s);
std::string& rtrim(std::string& s);
std::string& trim(std::string& s);
std::string trim_copy(const std::string& s);

} // namespace conduit
