#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace StringUtils {

inline std::string toLower(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

inline std::string toUpper(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return result;
}

inline std::string trim(std::string_view str) {
  const auto start = std::find_if_not(
      str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });

  const auto end =
      std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
      }).base();

  return (start < end) ? std::string(start, end) : std::string{};
}

inline bool startsWith(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

inline bool equalsIgnoreCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char c1, char c2) {
           return std::tolower(static_cast<unsigned char>(c1)) ==
                  std::tolower(static_cast<unsigned char>(c2));
         });
}

inline bool containsIgnoreCase(std::string_view haystack,
                               std::string_view needle) {
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(),
                        needle.end(), [](char ch1, char ch2) {
                          return std::tolower(static_cast<unsigned char>(ch1)) ==
                                 std::tolower(static_cast<unsigned char>(ch2));
                        });
  return it != haystack.end();
}

inline bool lessIgnoreCase(std::string_view a, std::string_view b) {
  return toLower(a) < toLower(b);
}

inline std::vector<std::string> split(std::string_view str, char delimiter) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t pos = str.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(str.substr(start));
      break;
    }
    parts.emplace_back(str.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

inline std::string join(const std::vector<std::string> &parts,
                        std::string_view separator) {
  std::string result;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      result += separator;
    result += parts[i];
  }
  return result;
}

// Collapses every run of whitespace into a single space and trims the ends.
inline std::string normalizeWhitespace(std::string_view str) {
  std::string result;
  result.reserve(str.size());
  bool pendingSpace = false;
  for (char c : str) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pendingSpace = !result.empty();
      continue;
    }
    if (pendingSpace) {
      result += ' ';
      pendingSpace = false;
    }
    result += c;
  }
  return result;
}

inline std::string truncate(std::string_view str, size_t maxLength,
                            std::string_view ellipsis = "...") {
  if (str.size() <= maxLength)
    return std::string(str);
  return std::string(str.substr(0, maxLength)) + std::string(ellipsis);
}

} // namespace StringUtils

#endif
