#pragma once
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <range/v3/view.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace utils {

using namespace ranges;

/**
 * Since we can't switch() on strings we use hashes instead.
 * Adapted from https://stackoverflow.com/a/46711735/3901988
 */
constexpr uint32_t hash(const std::string_view data) noexcept {
  uint32_t hash = 5385;
  for (const auto &e : data)
    hash = ((hash << 5) + hash) + e;
  return hash;
}

inline std::string to_lower(std::string_view str) {
  std::string result(str);
  std::transform(str.begin(), str.end(), result.begin(), [](unsigned char c) { return std::tolower(c); });
  return result;
}

/**
 * Splits the given string into an array of strings at any given separator
 */
inline std::vector<std::string_view> split(std::string_view str, char separator) {
  return str                                                                                              //
         | views::split(separator)                                                                        //
         | views::transform([](auto &&ptrs) { return std::string_view(&*ptrs.begin(), distance(ptrs)); }) //
         | to_vector;                                                                                     //
}

/**
 * Join a list of strings into a single string with separator in between elements
 */
inline std::string join(const std::vector<std::string> &vec, std::string_view separator) {
  return vec | views::join(separator) | to<std::string>();
}

/**
 * Copies out a string_view content back to a string
 */
inline std::string to_string(std::string_view str) {
  return {str.begin(), str.end()};
}

inline std::string_view trim(std::string_view str) {
  auto begin = str.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos)
    return {};
  auto end = str.find_last_not_of(" \t\r\n");
  return str.substr(begin, end - begin + 1);
}

inline bool starts_with(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

inline const char *get_env(const char *tag, const char *def = nullptr) noexcept {
  const char *ret = std::getenv(tag);
  return ret ? ret : def;
}

} // namespace utils
