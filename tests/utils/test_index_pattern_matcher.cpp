#include "test_runner.h"
#include "utils/IndexPatternMatcher.h"

int main() {
  TestRunner runner;
  runner.printHeader("INDEX PATTERN MATCHER");

  runner.runTest("Wildcards", [&]() {
    runner.assertTrue(IndexPatternMatcher::matches("logs-*", "logs-2024.01"),
                      "Star");
    runner.assertTrue(IndexPatternMatcher::matches("log?", "logs"), "Question");
    runner.assertFalse(IndexPatternMatcher::matches("log?", "log"),
                       "Question needs one character");
    runner.assertTrue(IndexPatternMatcher::matches("*", "anything"), "All");
  });

  runner.runTest("Literal characters", [&]() {
    runner.assertFalse(IndexPatternMatcher::matches("logs.*", "logsX2024"),
                       "Dot is literal");
    runner.assertTrue(IndexPatternMatcher::matches("a+b(*)", "a+b(1)"),
                      "Regex specials are literal");
    runner.assertFalse(IndexPatternMatcher::matches("logs", "logs-1"),
                       "Exact name");
  });

  runner.runTest("Expansion keeps first-seen order without duplicates", [&]() {
    std::vector<std::string> names = {"audit", "logs-b", "logs-a", "metrics"};
    std::vector<std::string> result =
        IndexPatternMatcher::expand({"logs-a", "logs-*", "audit"}, names);
    runner.assertEquals(3, result.size(), "Three indices");
    runner.assertEquals("logs-a", result[0], "Explicit name first");
    runner.assertEquals("logs-b", result[1], "Then the wildcard match");
    runner.assertEquals("audit", result[2], "Then audit");
    runner.assertTrue(IndexPatternMatcher::match("none-*", names).empty(),
                      "No match");
  });

  return runner.printSummary();
}
