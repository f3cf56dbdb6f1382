#ifndef INDEX_PATTERN_MATCHER_H
#define INDEX_PATTERN_MATCHER_H

#include <string>
#include <vector>

// Wildcard matching for index selections. '*' matches any run of characters,
// '?' exactly one, everything else (including '.') matches itself.
class IndexPatternMatcher {
public:
  static bool matches(const std::string &pattern, const std::string &name);

  // Names from the input that match, in input order and without duplicates.
  static std::vector<std::string> match(const std::string &pattern,
                                        const std::vector<std::string> &names);

  // Union of match() over several patterns, in first-seen order.
  static std::vector<std::string>
  expand(const std::vector<std::string> &patterns,
         const std::vector<std::string> &names);

  static bool hasWildcard(const std::string &pattern);

private:
  static std::string toRegex(const std::string &pattern);
};

#endif
