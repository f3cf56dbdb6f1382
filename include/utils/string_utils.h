#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <stdexcept>
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

inline bool endsWith(std::string_view str, std::string_view suffix) {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool isUnsignedInteger(std::string_view str) {
  if (str.empty())
    return false;
  return std::all_of(str.begin(), str.end(),
                     [](unsigned char c) { return std::isdigit(c); });
}

// Optional leading '-' followed by digits.
inline bool isSignedInteger(std::string_view str) {
  if (!str.empty() && str.front() == '-')
    str.remove_prefix(1);
  return isUnsignedInteger(str);
}

// Database and table names: [A-Za-z0-9_-], 1..64 characters.
inline bool isValidTableName(std::string_view name) {
  if (name.empty() || name.size() > 64)
    return false;
  return std::all_of(name.begin(), name.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-';
  });
}

// Elasticsearch index naming rules.
inline bool isValidIndexName(std::string_view name) {
  if (name.empty() || name.size() > 255 || name == "." || name == "..")
    return false;
  char first = name.front();
  if (first == '-' || first == '_' || first == '+')
    return false;
  static constexpr std::string_view forbidden = "\\/*?\"<>| ,#:";
  for (char c : name) {
    if (std::isupper(static_cast<unsigned char>(c)))
      return false;
    if (forbidden.find(c) != std::string_view::npos)
      return false;
  }
  return true;
}

// Replaces every character not allowed in a table name with '_' and cuts the
// result to 64 characters.
inline std::string sanitizeTableName(std::string_view name) {
  std::string cleaned;
  cleaned.reserve(name.size());
  for (char c : name) {
    unsigned char uc = static_cast<unsigned char>(c);
    cleaned += (std::isalnum(uc) || c == '_' || c == '-') ? c : '_';
  }
  if (cleaned.size() > 64)
    cleaned.resize(64);
  return cleaned;
}

inline std::string escapeMySQLIdentifier(std::string_view identifier) {
  if (identifier.empty()) {
    throw std::invalid_argument("Identifier cannot be empty");
  }
  std::string escaped = "`";
  for (char c : identifier) {
    if (c == '`')
      escaped += "``";
    else
      escaped += c;
  }
  escaped += '`';
  return escaped;
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

std::string base64Encode(std::string_view data);
// Throws std::invalid_argument on malformed input.
std::string base64Decode(std::string_view encoded);

} // namespace StringUtils

#endif
