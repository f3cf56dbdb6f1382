#include "sync/ProgressAggregator.h"
#include "test_runner.h"

namespace {

UnitRuntime unitAt(const std::string &source, UnitStatus status,
                   uint64_t total, uint64_t processed) {
  UnitRuntime runtime;
  runtime.unit = {source, source + "_target"};
  runtime.status = status;
  runtime.totalRecords = total;
  runtime.processedRecords = processed;
  return runtime;
}

} // namespace

int main() {
  TestRunner runner;
  runner.printHeader("PROGRESS AGGREGATOR");

  runner.runTest("Totals are sums and percentage is weighted", [&]() {
    ProgressAggregator aggregator;
    std::vector<UnitRuntime> units = {
        unitAt("a", UnitStatus::Running, 900, 300),
        unitAt("b", UnitStatus::Pending, 100, 0)};
    TaskProgress p = aggregator.compute(TaskStatus::Running, units, 0);
    runner.assertEquals(1000, p.totalRecords, "Total");
    runner.assertEquals(300, p.processedRecords, "Processed");
    runner.assertNear(30.0, p.percentage, 1e-9, "Weighted by record count");
    runner.assertEquals(1, p.currentUnits.size(), "One running unit");
    runner.assertEquals(1, p.unitsByStatus["running"], "Running count");
    runner.assertEquals(1, p.unitsByStatus["pending"], "Pending count");
    runner.assertEquals(0, p.unitsByStatus["failed"], "All statuses listed");
  });

  runner.runTest("Speed and ETA use the monotonic start instant", [&]() {
    ProgressAggregator aggregator;
    aggregator.markStarted();
    runner.assertTrue(aggregator.started(), "Started");
    runner.assertNotEmpty(
        aggregator.compute(TaskStatus::Running, {}, 0).startTime,
        "Start time rendered");

    std::vector<UnitRuntime> units = {
        unitAt("a", UnitStatus::Running, 1000, 500)};
    auto later = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    TaskProgress p = aggregator.compute(TaskStatus::Running, units, 0, later);
    runner.assertTrue(p.speed > 40.0 && p.speed <= 50.0,
                      "About 50 records per second");
    runner.assertTrue(p.estimatedSecondsRemaining.has_value(), "ETA known");
    runner.assertNear(500.0 / p.speed, *p.estimatedSecondsRemaining, 1e-6,
                      "ETA is remaining over speed");
  });

  runner.runTest("ETA is unknown before anything is processed", [&]() {
    ProgressAggregator aggregator;
    aggregator.markStarted();
    std::vector<UnitRuntime> units = {unitAt("a", UnitStatus::Running, 10, 0)};
    TaskProgress p = aggregator.compute(TaskStatus::Running, units, 0);
    runner.assertFalse(p.estimatedSecondsRemaining.has_value(), "No ETA");
    runner.assertTrue(p.toJson()["estimatedSecondsRemaining"].is_null(),
                      "Rendered as null");
  });

  runner.runTest("Completed unit counts as fully processed", [&]() {
    ProgressAggregator aggregator;
    std::vector<UnitRuntime> units = {
        unitAt("a", UnitStatus::Completed, 120, 100)};
    TaskProgress p = aggregator.compute(TaskStatus::Completed, units, 0);
    runner.assertEquals(100, p.totalRecords,
                        "Estimate replaced by the real count");
    runner.assertNear(100.0, p.percentage, 1e-9, "Complete");
  });

  runner.runTest("Processed above the estimate never exceeds 100%", [&]() {
    ProgressAggregator aggregator;
    std::vector<UnitRuntime> units = {
        unitAt("a", UnitStatus::Running, 100, 150)};
    TaskProgress p = aggregator.compute(TaskStatus::Running, units, 3);
    runner.assertNear(100.0, p.percentage, 1e-9, "Clamped");
    runner.assertEquals(3, p.errorCount, "Error count passed through");
  });

  runner.runTest("Empty completed task is at 100%", [&]() {
    ProgressAggregator aggregator;
    TaskProgress p = aggregator.compute(TaskStatus::Completed, {}, 0);
    runner.assertNear(100.0, p.percentage, 1e-9, "Nothing to do is done");
    nlohmann::json j = p.toJson();
    runner.assertEquals("completed", j["status"].get<std::string>(),
                        "Status rendered");
    runner.assertTrue(j["units"].is_array(), "Units rendered as array");
  });

  return runner.printSummary();
}
