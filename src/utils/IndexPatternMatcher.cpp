#include "utils/IndexPatternMatcher.h"
#include <regex>
#include <unordered_set>

std::string IndexPatternMatcher::toRegex(const std::string &pattern) {
  static const std::string special = "\\^$.|+()[]{}";
  std::string regex;
  regex.reserve(pattern.size() * 2);
  for (char c : pattern) {
    if (c == '*') {
      regex += ".*";
    } else if (c == '?') {
      regex += '.';
    } else {
      if (special.find(c) != std::string::npos)
        regex += '\\';
      regex += c;
    }
  }
  return regex;
}

bool IndexPatternMatcher::hasWildcard(const std::string &pattern) {
  return pattern.find_first_of("*?") != std::string::npos;
}

bool IndexPatternMatcher::matches(const std::string &pattern,
                                  const std::string &name) {
  if (!hasWildcard(pattern))
    return pattern == name;
  return std::regex_match(name, std::regex(toRegex(pattern)));
}

std::vector<std::string>
IndexPatternMatcher::match(const std::string &pattern,
                           const std::vector<std::string> &names) {
  return expand({pattern}, names);
}

std::vector<std::string>
IndexPatternMatcher::expand(const std::vector<std::string> &patterns,
                            const std::vector<std::string> &names) {
  std::vector<std::string> result;
  std::unordered_set<std::string> seen;

  for (const auto &pattern : patterns) {
    if (!hasWildcard(pattern)) {
      for (const auto &name : names) {
        if (name == pattern && seen.insert(name).second)
          result.push_back(name);
      }
      continue;
    }

    std::regex compiled(toRegex(pattern));
    for (const auto &name : names) {
      if (std::regex_match(name, compiled) && seen.insert(name).second)
        result.push_back(name);
    }
  }
  return result;
}
