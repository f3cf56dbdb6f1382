#include "core/sync_config.h"
#include "test_runner.h"

int main() {
  TestRunner runner;
  runner.printHeader("SYNC CONFIG - VALIDATION");

  runner.runTest("Defaults", [&]() {
    SyncConfig config;
    runner.assertEquals(4, config.threadCount(), "Four threads");
    runner.assertEquals(0, config.batchSize(), "Adaptive batch size");
    runner.assertEquals("skip", errorStrategyToString(config.errorStrategy()),
                        "Skip by default");
    runner.assertEquals(
        "drop", unitExistsStrategyToString(config.unitExistsStrategy()),
        "Drop by default");
  });

  runner.runTest("threadCount bounds", [&]() {
    SyncConfig config;
    runner.assertThrows<std::invalid_argument>(
        [&]() { config.setThreadCount(0); }, "0 threads rejected");
    runner.assertThrows<std::invalid_argument>(
        [&]() { config.setThreadCount(SyncConfig::MAX_THREAD_COUNT + 1); },
        "Above the maximum rejected");
    config.setThreadCount(SyncConfig::MAX_THREAD_COUNT);
    runner.assertEquals(SyncConfig::MAX_THREAD_COUNT, config.threadCount(),
                        "Maximum accepted");
    config.setThreadCount(1);
    runner.assertEquals(1, config.threadCount(), "Minimum accepted");
  });

  runner.runTest("batchSize bounds and the adaptive default", [&]() {
    SyncConfig config;
    runner.assertEquals(500, config.effectiveBatchSize(500),
                        "0 selects the destination default");
    config.setBatchSize(250);
    runner.assertEquals(250, config.effectiveBatchSize(500),
                        "Explicit size wins");
    runner.assertThrows<std::invalid_argument>(
        [&]() { config.setBatchSize(SyncConfig::MAX_BATCH_SIZE + 1); },
        "Oversized batch rejected");
    config.setBatchSize(0);
    runner.assertEquals(1000, config.effectiveBatchSize(1000),
                        "Back to adaptive");
  });

  runner.runTest("readPageSize and progress interval bounds", [&]() {
    SyncConfig config;
    runner.assertThrows<std::invalid_argument>(
        [&]() { config.setReadPageSize(0); }, "Empty pages rejected");
    runner.assertThrows<std::invalid_argument>(
        [&]() { config.setProgressIntervalMs(10); }, "Interval too short");
    config.setProgressIntervalMs(5000);
    runner.assertEquals(5000, config.progressIntervalMs(), "Interval kept");
  });

  runner.runTest("Strategy parsing", [&]() {
    runner.assertTrue(parseErrorStrategy(" PAUSE ") == ErrorStrategy::Pause,
                      "Case and space insensitive");
    runner.assertTrue(parseUnitExistsStrategy("backup") ==
                          UnitExistsStrategy::Backup,
                      "backup");
    runner.assertTrue(parseUnitExistsStrategy("Truncate") ==
                          UnitExistsStrategy::Truncate,
                      "truncate");
    runner.assertThrows<std::invalid_argument>(
        [&]() { parseErrorStrategy("retry"); }, "Unknown strategy");
    runner.assertThrows<std::invalid_argument>(
        [&]() { parseUnitExistsStrategy("merge"); }, "Unknown exists strategy");
  });

  return runner.printSummary();
}
