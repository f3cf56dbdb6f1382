#include "core/logger.h"
#include "fixtures/memory_engine.h"
#include "sync/SyncEngine.h"
#include "test_runner.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace {

TaskDefinition shopTask(const std::string &taskId, size_t threads,
                        size_t batchSize) {
  TaskDefinition task;
  task.taskId = taskId;
  task.source.kind = EndpointKind::MySQL;
  task.target.kind = EndpointKind::Elasticsearch;
  task.databases.push_back({"shop", {}});
  task.sync.setThreadCount(threads);
  task.sync.setBatchSize(batchSize);
  task.sync.setReadPageSize(batchSize);
  return task;
}

std::shared_ptr<MemorySource> shopSource(size_t tables, size_t rowsPerTable) {
  auto source = std::make_shared<MemorySource>(EndpointKind::MySQL);
  for (size_t i = 0; i < tables; ++i) {
    source->addUnit("shop.t" + std::to_string(i), memoryTableSchema(),
                    memoryRows(rowsPerTable));
  }
  return source;
}

size_t countStatus(const std::vector<UnitRuntime> &units, UnitStatus status) {
  size_t count = 0;
  for (const auto &unit : units) {
    if (unit.status == status)
      count++;
  }
  return count;
}

} // namespace

int main() {
  TestRunner runner;
  Logger::initialize();
  Logger::setLogLevel(LogLevel::ERROR);

  runner.printHeader("SYNC ENGINE - TASK LIFECYCLE");

  runner.runTest("Ten units on four threads with one provision failure",
                 [&]() {
    EventChannel events;
    SyncEngine engine(events);
    auto source = shopSource(10, 120);
    auto destination = std::make_shared<MemoryDestination>();
    destination->failProvision.insert("shop_t3");

    engine.registerTask(shopTask("ten-units", 4, 50), source, destination);
    engine.start("ten-units");
    TaskStatus status = engine.wait("ten-units");

    runner.assertEquals("failed", taskStatusToString(status),
                        "A failed unit fails the task");
    auto units = engine.unitRuntimes("ten-units");
    runner.assertEquals(10, units.size(), "All tables resolved");
    runner.assertEquals(9, countStatus(units, UnitStatus::Completed),
                        "Other units complete");
    runner.assertEquals(1, countStatus(units, UnitStatus::Failed),
                        "One unit failed");
    for (const auto &unit : units) {
      if (unit.unit.target == "shop_t3")
        continue;
      runner.assertEquals(120, destination->recordCount(unit.unit.target),
                          unit.unit.target + " fully written");
    }

    TaskProgress progress = engine.progress("ten-units");
    runner.assertEquals(1, progress.unitsByStatus["failed"],
                        "Progress counts the failed unit");
    runner.assertEquals(9, progress.unitsByStatus["completed"],
                        "Progress counts completed units");
    runner.assertGreaterOrEqual(1, progress.errorCount, "Error logged");

    bool sawProvisionError = false;
    for (const auto &entry : engine.errors("ten-units"))
      sawProvisionError |= entry.kind == ErrorKind::Provision;
    runner.assertTrue(sawProvisionError, "Provision error in the error log");
  });

  runner.runTest("Completed task reports every unit done", [&]() {
    EventChannel events;
    SyncEngine engine(events);
    auto destination = std::make_shared<MemoryDestination>();
    engine.registerTask(shopTask("all-good", 2, 40), shopSource(3, 100),
                        destination);
    engine.start("all-good");

    runner.assertEquals("completed", taskStatusToString(engine.wait("all-good")),
                        "Task completes");
    TaskProgress progress = engine.progress("all-good");
    runner.assertEquals(300, progress.totalRecords, "Totals counted up front");
    runner.assertEquals(300, progress.processedRecords, "All processed");
    runner.assertNear(100.0, progress.percentage, 0.001, "Complete");

    bool sawCompletedStatus = false;
    for (const auto &event : events.drain()) {
      if (event.kind == SyncEventKind::StatusChange &&
          event.payload.value("scope", "") == "task" &&
          event.payload.value("status", "") == "completed")
        sawCompletedStatus = true;
    }
    runner.assertTrue(sawCompletedStatus, "Completion published");
  });

  runner.runTest("Progress can be polled while the task restarts", [&]() {
    EventChannel events;
    SyncEngine engine(events);
    auto destination = std::make_shared<MemoryDestination>();
    engine.registerTask(shopTask("restarts", 2, 20), shopSource(2, 40),
                        destination);

    std::atomic<bool> done{false};
    std::atomic<size_t> polls{0};
    std::atomic<bool> overflow{false};
    std::thread observer([&]() {
      while (!done.load()) {
        TaskProgress progress = engine.progress("restarts");
        if (progress.percentage > 100.0)
          overflow = true;
        polls++;
      }
    });

    size_t completed = 0;
    for (int i = 0; i < 50; ++i) {
      engine.start("restarts");
      if (engine.wait("restarts") == TaskStatus::Completed)
        completed++;
    }
    done = true;
    observer.join();
    events.drain();

    runner.assertEquals(50, completed, "Every run completes");
    runner.assertTrue(polls.load() > 0, "Observer ran alongside");
    runner.assertFalse(overflow.load(), "Percentage stays within bounds");
    runner.assertNotEmpty(engine.progress("restarts").startTime,
                          "Start time reported");
  });

  runner.runTest("Unreachable source fails start with a connection error",
                 [&]() {
    EventChannel events;
    SyncEngine engine(events);
    auto source = shopSource(2, 10);
    source->failPing = true;
    auto destination = std::make_shared<MemoryDestination>();
    engine.registerTask(shopTask("no-source", 2, 10), source, destination);

    runner.assertThrows<ConnectionError>([&]() { engine.start("no-source"); },
                                         "start should throw");
    runner.assertEquals("idle", taskStatusToString(engine.status("no-source")),
                        "Task stays idle");
    runner.assertEquals(0, destination->provisioned.size(),
                        "Nothing provisioned");
    auto errors = engine.errors("no-source");
    runner.assertTrue(!errors.empty() &&
                          errors[0].kind == ErrorKind::Connection,
                      "Connection error logged");
  });

  runner.runTest("Start twice is rejected while running", [&]() {
    EventChannel events;
    SyncEngine engine(events);
    auto destination = std::make_shared<MemoryDestination>();
    destination->beforeWrite = [](const std::string &, size_t) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    };
    engine.registerTask(shopTask("busy", 1, 10), shopSource(1, 100),
                        destination);
    engine.start("busy");
    runner.assertThrows<std::logic_error>([&]() { engine.start("busy"); },
                                          "second start should throw");
    engine.stop("busy");
  });

  runner.runTest("Pause then resume completes without duplicates", [&]() {
    EventChannel events;
    SyncEngine engine(events);
    auto destination = std::make_shared<MemoryDestination>();
    destination->beforeWrite = [&engine](const std::string &unit,
                                         size_t call) {
      if (unit == "shop_t0" && call == 2)
        engine.pause("pausable");
    };
    engine.registerTask(shopTask("pausable", 2, 25), shopSource(4, 200),
                        destination);
    engine.start("pausable");

    runner.assertEquals("paused", taskStatusToString(engine.wait("pausable")),
                        "Task pauses");
    auto paused = engine.unitRuntimes("pausable");
    runner.assertEquals(0, countStatus(paused, UnitStatus::Running),
                        "No unit left running");
    runner.assertTrue(countStatus(paused, UnitStatus::Completed) < 4,
                      "Pause landed before the end");

    destination->beforeWrite = nullptr;
    runner.assertTrue(engine.resume("pausable"), "Resume accepted");
    runner.assertEquals("completed", taskStatusToString(engine.wait("pausable")),
                        "Task completes after resume");
    for (int i = 0; i < 4; ++i) {
      std::string target = "shop_t" + std::to_string(i);
      runner.assertEquals(200, destination->recordCount(target),
                          target + " written exactly once");
    }
    runner.assertFalse(engine.resume("pausable"),
                       "Resume of a completed task is refused");
  });

  runner.runTest("Stop resets every unit to pending", [&]() {
    EventChannel events;
    SyncEngine engine(events);
    auto destination = std::make_shared<MemoryDestination>();
    destination->beforeWrite = [](const std::string &, size_t) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    };
    engine.registerTask(shopTask("stoppable", 2, 10), shopSource(4, 500),
                        destination);
    engine.start("stoppable");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    engine.stop("stoppable");

    runner.assertEquals("idle", taskStatusToString(engine.status("stoppable")),
                        "Stopped task is idle");
    for (const auto &unit : engine.unitRuntimes("stoppable")) {
      runner.assertEquals("pending", unitStatusToString(unit.status),
                          unit.unit.source + " reset");
      runner.assertEquals(0, unit.processedRecords,
                          unit.unit.source + " counters reset");
    }

    destination->beforeWrite = nullptr;
    engine.start("stoppable");
    runner.assertEquals("completed",
                        taskStatusToString(engine.wait("stoppable")),
                        "Restart after stop runs from scratch");
    runner.assertEquals(500, destination->recordCount("shop_t2"),
                        "Re-provisioned unit holds each row once");
  });

  runner.runTest("Pause policy halts the whole task on a record failure",
                 [&]() {
    EventChannel events;
    SyncEngine engine(events);
    auto destination = std::make_shared<MemoryDestination>();
    destination->rejectRecord = [](const Record &r) {
      return r.documentId == "7";
    };
    TaskDefinition task = shopTask("halting", 1, 10);
    task.sync.setErrorStrategy(ErrorStrategy::Pause);
    engine.registerTask(task, shopSource(3, 50), destination);
    engine.start("halting");

    runner.assertEquals("paused", taskStatusToString(engine.wait("halting")),
                        "Task pauses on the first failure");
    auto units = engine.unitRuntimes("halting");
    runner.assertEquals(1, countStatus(units, UnitStatus::Paused),
                        "Failing unit paused");
    runner.assertEquals(2, countStatus(units, UnitStatus::Pending),
                        "Other units never claimed");
  });

  runner.runTest("Unknown task ids and duplicate registration", [&]() {
    EventChannel events;
    SyncEngine engine(events);
    runner.assertThrows<std::invalid_argument>(
        [&]() { engine.start("missing"); }, "unknown id");
    engine.registerTask(shopTask("dup", 1, 10), shopSource(1, 1),
                        std::make_shared<MemoryDestination>());
    runner.assertThrows<std::invalid_argument>(
        [&]() {
          engine.registerTask(shopTask("dup", 1, 10), shopSource(1, 1),
                              std::make_shared<MemoryDestination>());
        },
        "duplicate id");
    engine.release("dup");
    runner.assertEquals(0, engine.taskIds().size(), "Released");
  });

  int result = runner.printSummary();
  Logger::shutdown();
  return result;
}
