
#include "base-include.hpp"

#include "string-utils.hpp"

namespace conduit {
// ----------------------------------------------------------------- Replace All
/**
 * @ingroup conduit-strings
 * @brief `replace_all(s, "{operation}", "echo")` turns "/api/{operation}" into "/api/echo"
 */
std::size_t replace_all(std::string& s, std::string_view from, std::string_view to) {
  if (from.empty())
    return 0;
  std::size_t counter = 0;
  std::size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
    ++counter;
  }
  return counter;
}

std::size_t count_occurrences(std::string_view s, std::string_view needle) {
  if (needle.empty())
    return 0;
  std::size_t counter = 0;
  for (auto pos = s.find(needle); pos != std::string_view::npos;
       pos = s.find(needle, pos + needle.size()))
    ++counter;
  return counter;
}

// ------------------------------------------------------------------------ Trim
/**
 * @ingroup conduit-strings
 * @brief Trims `s` from the left, inplace
 */
string& ltrim(std::string& s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); }));
  return s;
}

/**
 * @ingroup conduit-strings
 * @brief Trims `s` from the right (ie, end), inplace
 */
string& rtrim(std::string& s) {
  s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); }).base(),
          s.end());
  return s;
}

/**
 * @ingroup conduit-strings
 * @brief Trims whitespace from the start and end of `s`, inplace.
 */
string& trim(std::string& s) {
  ltrim(s);
  rtrim(s);
  return s;
}

/**
 * @ingroup conduit-strings
 * @brief Trims whitespace from the start and end of `s`.
 */
string trim_copy(const std::string& s) {
  auto ret = s;
  trim(ret);
  return ret;
}

} // namespace conduit
