#include "core/logger.h"
#include "fixtures/memory_engine.h"
#include "sync/PipelineCoordinator.h"
#include "test_runner.h"
#include <memory>
#include <set>

namespace {

const SyncUnit ORDERS{"shop.orders", "shop_orders"};

struct PipelineFixture {
  MemorySource source;
  MemoryDestination destination;
  EventChannel events;
  TaskSignals signals;
  std::unique_ptr<UnitRuntimeTable> runtimes;
  std::unique_ptr<ErrorSink> errors;
  PipelineContext ctx;
  std::vector<bool> rejectedBatches;

  PipelineFixture(std::vector<Record> rows, ErrorStrategy strategy,
                  size_t batchSize, size_t pageSize) {
    source.addUnit(ORDERS.source, memoryTableSchema(), std::move(rows));
    runtimes = std::make_unique<UnitRuntimeTable>(std::vector<SyncUnit>{ORDERS});
    errors = std::make_unique<ErrorSink>("orders-task", strategy, &events);

    ctx.taskId = "orders-task";
    ctx.source = &source;
    ctx.destination = &destination;
    ctx.config.setBatchSize(batchSize);
    ctx.config.setReadPageSize(pageSize);
    ctx.config.setErrorStrategy(strategy);
    ctx.runtimes = runtimes.get();
    ctx.errors = errors.get();
    ctx.events = &events;
    ctx.signals = &signals;
    ctx.onBatchWritten = [this](std::chrono::milliseconds, bool rejected) {
      rejectedBatches.push_back(rejected);
    };
  }

  PipelineOutcome run() {
    PipelineCoordinator coordinator(ctx, 0);
    return coordinator.run();
  }

  UnitRuntime state() const { return runtimes->snapshot(0); }
};

bool idDivisibleBy(const Record &record, int64_t divisor) {
  return std::stoll(record.documentId) % divisor == 0;
}

} // namespace

int main() {
  TestRunner runner;
  Logger::initialize();
  Logger::setLogLevel(LogLevel::ERROR);

  runner.printHeader("PIPELINE COORDINATOR - BATCHING, PAUSE AND POLICIES");

  runner.runTest("2500 rows with batch size 1000 are written as 1000/1000/500",
                 [&]() {
    PipelineFixture f(memoryRows(2500), ErrorStrategy::Skip, 1000, 1000);
    PipelineOutcome outcome = f.run();

    runner.assertEquals("completed", pipelineOutcomeToString(outcome),
                        "Unit should complete");
    std::vector<size_t> sizes = f.destination.batchSizes(ORDERS.target);
    runner.assertEquals(3, sizes.size(), "Three write calls expected");
    if (sizes.size() == 3) {
      runner.assertEquals(1000, sizes[0], "First batch");
      runner.assertEquals(1000, sizes[1], "Second batch");
      runner.assertEquals(500, sizes[2], "Last batch");
    }
    UnitRuntime state = f.state();
    runner.assertEquals(2500, state.processedRecords, "Processed count");
    runner.assertEquals(2500, state.totalRecords,
                        "Completed unit total equals processed");
    runner.assertEquals(0, state.failedRecords, "No failures");
    runner.assertEquals(2500, f.destination.documentIds(ORDERS.target).size(),
                        "Every row written once with its key as id");
    runner.assertEquals(1, f.source.readerCloses.load(),
                        "Reader released after the last page");
  });

  runner.runTest("Batches never exceed the batch size across page boundaries",
                 [&]() {
    PipelineFixture f(memoryRows(2500), ErrorStrategy::Skip, 700, 300);
    runner.assertEquals("completed", pipelineOutcomeToString(f.run()),
                        "Unit should complete");
    std::vector<size_t> sizes = f.destination.batchSizes(ORDERS.target);
    size_t total = 0;
    for (size_t size : sizes) {
      runner.assertTrue(size <= 700, "Batch of " + std::to_string(size) +
                                         " exceeds 700");
      total += size;
    }
    runner.assertEquals(2500, total, "All rows written");
    runner.assertEquals(4, sizes.size(), "700+700+700+400");
  });

  runner.runTest("Documents carry the primary key as id and mapped values",
                 [&]() {
    PipelineFixture f(memoryRows(3), ErrorStrategy::Skip, 10, 10);
    f.run();
    std::lock_guard<std::mutex> lock(f.destination.mutex);
    const auto &docs = f.destination.written[ORDERS.target];
    runner.assertEquals(3, docs.size(), "Three documents");
    if (docs.size() == 3) {
      runner.assertEquals("2", docs[1].documentId, "Id from primary key");
      const FieldValue *id = docs[1].get("id");
      runner.assertTrue(id && id->kind() == FieldKind::Integer,
                        "Integer column stays an integer");
      const FieldValue *name = docs[1].get("name");
      runner.assertTrue(name && name->asString() == "row-2",
                        "String column copied");
    }
  });

  runner.runTest("Pause at a batch boundary then resume writes every row once",
                 [&]() {
    PipelineFixture f(memoryRows(2500), ErrorStrategy::Skip, 1000, 1000);
    f.destination.beforeWrite = [&f](const std::string &, size_t call) {
      if (call == 2)
        f.signals.requestPause();
    };

    PipelineOutcome first = f.run();
    runner.assertEquals("paused", pipelineOutcomeToString(first),
                        "First segment pauses");
    runner.assertEquals("paused", unitStatusToString(f.state().status),
                        "Unit reported paused");
    runner.assertEquals(2000, f.state().processedRecords,
                        "In-flight batch finished before pausing");
    runner.assertEquals(0, f.source.readerCloses.load(),
                        "Reader kept open for resume");

    f.signals.clear();
    f.destination.beforeWrite = nullptr;
    PipelineOutcome second = f.run();
    runner.assertEquals("completed", pipelineOutcomeToString(second),
                        "Second segment completes");
    runner.assertEquals(2500, f.destination.recordCount(ORDERS.target),
                        "No row written twice");
    runner.assertEquals(2500, f.destination.documentIds(ORDERS.target).size(),
                        "Every id present");
    runner.assertEquals(1, f.destination.provisioned.size(),
                        "Destination provisioned only once");
    runner.assertEquals(2500, f.state().processedRecords,
                        "Processed count continues across the pause");
  });

  runner.runTest("Pause requested before the unit starts leaves it pending",
                 [&]() {
    PipelineFixture f(memoryRows(10), ErrorStrategy::Skip, 5, 5);
    f.signals.requestPause();
    runner.assertEquals("not_started", pipelineOutcomeToString(f.run()),
                        "Unit not claimed");
    runner.assertEquals("pending", unitStatusToString(f.state().status),
                        "Unit stays pending");
    runner.assertEquals(0, f.destination.provisioned.size(),
                        "Nothing provisioned");
  });

  runner.runTest("Skip policy records failures and keeps going", [&]() {
    PipelineFixture f(memoryRows(2500), ErrorStrategy::Skip, 1000, 1000);
    f.destination.rejectRecord = [](const Record &r) {
      return idDivisibleBy(r, 100);
    };

    runner.assertEquals("completed", pipelineOutcomeToString(f.run()),
                        "Unit completes under skip");
    UnitRuntime state = f.state();
    runner.assertEquals(2500, state.processedRecords,
                        "Rejected rows count as processed");
    runner.assertEquals(25, state.failedRecords, "25 rejected rows");
    runner.assertEquals(25, f.errors->errorCount(), "One log entry each");
    runner.assertEquals(2475, f.destination.recordCount(ORDERS.target),
                        "Accepted rows written");

    auto entries = f.errors->entries();
    runner.assertTrue(!entries.empty() && entries[0].context.contains("documentId"),
                      "Failure context names the document");
    runner.assertFalse(f.errors->haltRequested(), "Skip never halts");
  });

  runner.runTest("Pause policy halts the unit after the failing batch",
                 [&]() {
    PipelineFixture f(memoryRows(2500), ErrorStrategy::Pause, 1000, 1000);
    f.destination.rejectRecord = [](const Record &r) {
      return idDivisibleBy(r, 100);
    };

    runner.assertEquals("paused", pipelineOutcomeToString(f.run()),
                        "Unit pauses on the first failure");
    runner.assertEquals(1000, f.state().processedRecords,
                        "Only the first batch processed");
    runner.assertEquals(10, f.state().failedRecords,
                        "Failures of the first batch recorded");
    runner.assertTrue(f.errors->haltRequested(), "Task-wide halt raised");
    runner.assertEquals(1, f.destination.batchSizes(ORDERS.target).size(),
                        "No further batch written");
  });

  runner.runTest("Rows that fail conversion are logged and skipped", [&]() {
    std::vector<Record> rows = memoryRows(5);
    rows[2].set("id", FieldValue::string("not-a-number"));
    PipelineFixture f(rows, ErrorStrategy::Skip, 10, 10);

    runner.assertEquals("completed", pipelineOutcomeToString(f.run()),
                        "Unit completes");
    runner.assertEquals(5, f.state().processedRecords, "All rows processed");
    runner.assertEquals(1, f.state().failedRecords, "One conversion failure");
    runner.assertEquals(4, f.destination.recordCount(ORDERS.target),
                        "Bad row never reaches the writer");
    auto entries = f.errors->entries();
    runner.assertTrue(!entries.empty() &&
                          entries[0].context.value("phase", "") == "convert",
                      "Failure tagged as a conversion problem");
  });

  runner.runTest("Rejected writes are reported as back-pressure", [&]() {
    PipelineFixture f(memoryRows(20), ErrorStrategy::Skip, 10, 10);
    f.destination.rejectKind = RecordFailureKind::Rejected;
    f.destination.rejectRecord = [](const Record &r) {
      return r.documentId == "3";
    };
    f.run();
    runner.assertEquals(2, f.rejectedBatches.size(), "Two batches reported");
    if (f.rejectedBatches.size() == 2) {
      runner.assertTrue(f.rejectedBatches[0], "First batch pushed back");
      runner.assertFalse(f.rejectedBatches[1], "Second batch healthy");
    }
  });

  runner.runTest("System error during a write pauses the unit", [&]() {
    PipelineFixture f(memoryRows(3000), ErrorStrategy::Skip, 1000, 1000);
    f.destination.throwSystemErrorOnCall[ORDERS.target] = 2;

    runner.assertEquals("paused", pipelineOutcomeToString(f.run()),
                        "System errors escalate to a pause");
    runner.assertEquals(1000, f.state().processedRecords,
                        "Checkpoint stays at the last acknowledged batch");
    runner.assertTrue(f.errors->haltRequested(), "Halt raised");
    auto entries = f.errors->entries();
    runner.assertTrue(!entries.empty() &&
                          entries.back().kind == ErrorKind::System,
                      "Logged as a system error");

    f.errors->resetHalt();
    f.destination.throwSystemErrorOnCall.clear();
    runner.assertEquals("completed", pipelineOutcomeToString(f.run()),
                        "Resume finishes the unit");
    runner.assertEquals(3000, f.destination.documentIds(ORDERS.target).size(),
                        "Every row present after resume");
  });

  runner.runTest("Refused batch under skip is logged and later batches run",
                 [&]() {
    PipelineFixture f(memoryRows(30), ErrorStrategy::Skip, 10, 10);
    f.destination.throwDataErrorOnCall[ORDERS.target] = 2;

    runner.assertEquals("completed", pipelineOutcomeToString(f.run()),
                        "Unit completes despite the refused batch");
    runner.assertEquals("completed", unitStatusToString(f.state().status),
                        "Status completed");
    runner.assertEquals(20, f.destination.recordCount(ORDERS.target),
                        "First and third batches written");
    runner.assertEquals(3, f.destination.batchSizes(ORDERS.target).size(),
                        "Third batch still attempted");
    runner.assertEquals(30, f.state().processedRecords,
                        "Refused rows count as processed");
    runner.assertEquals(10, f.state().failedRecords,
                        "Every row of the refused batch failed");
    runner.assertEquals(10, f.errors->errorCount(), "One entry per row");
    runner.assertFalse(f.errors->haltRequested(), "Skip never halts");

    auto entries = f.errors->entries();
    runner.assertTrue(!entries.empty() &&
                          entries[0].context.value("sourceOffset", 0) == 10,
                      "First entry points at the first refused row");
  });

  runner.runTest("Refused batch under pause halts and resumes past it",
                 [&]() {
    PipelineFixture f(memoryRows(30), ErrorStrategy::Pause, 10, 10);
    f.destination.throwDataErrorOnCall[ORDERS.target] = 2;

    runner.assertEquals("paused", pipelineOutcomeToString(f.run()),
                        "Unit pauses");
    runner.assertEquals(20, f.state().processedRecords,
                        "Checkpoint moved past the refused batch");
    runner.assertTrue(f.errors->haltRequested(), "Halt raised");

    f.errors->resetHalt();
    runner.assertEquals("completed", pipelineOutcomeToString(f.run()),
                        "Resume completes the unit");
    runner.assertEquals(20, f.destination.recordCount(ORDERS.target),
                        "Refused rows not retried");
  });

  runner.runTest("Unit percentage never decreases during a run", [&]() {
    PipelineFixture f(memoryRows(2500), ErrorStrategy::Skip, 300, 700);
    f.runtimes->update(0, [](UnitRuntime &runtime) {
      runtime.totalRecords = 2500;
    });
    std::vector<double> seen;
    f.ctx.onProgress = [&f, &seen]() {
      seen.push_back(f.state().percentage());
    };

    runner.assertEquals("completed", pipelineOutcomeToString(f.run()),
                        "Unit completes");
    runner.assertTrue(seen.size() > 2, "Progress reported per batch");
    for (size_t i = 1; i < seen.size(); ++i)
      runner.assertTrue(seen[i] >= seen[i - 1],
                        "Percentage dropped at sample " + std::to_string(i));
    runner.assertTrue(!seen.empty() && seen.back() == 100.0,
                      "Ends at 100 percent");
  });

  runner.runTest("Unsupported column type warns with the column and its type",
                 [&]() {
    PipelineFixture f(memoryRows(3), ErrorStrategy::Skip, 10, 10);
    Schema schema = memoryTableSchema();
    schema.columns.push_back({"weird", "foobar(3)", true, false});
    f.source.addUnit(ORDERS.source, schema, memoryRows(3));

    runner.assertEquals("completed", pipelineOutcomeToString(f.run()),
                        "Unknown types do not stop the unit");
    const ErrorLogEntry *warning = nullptr;
    auto entries = f.errors->entries();
    for (const auto &entry : entries) {
      if (entry.severity == "warning" &&
          entry.context.value("operation", "") == "map_schema")
        warning = &entry;
    }
    runner.assertTrue(warning != nullptr, "Schema warning logged");
    if (warning) {
      runner.assertEquals("weird", warning->context.value("column", ""),
                          "Bare column name");
      runner.assertEquals("foobar(3)", warning->context.value("sourceType", ""),
                          "Source type reported");
      runner.assertEquals(
          "unsupported type for column 'weird', using keyword",
          warning->message, "Fallback type named");
    }
    runner.assertEquals(0, f.errors->errorCount(),
                        "Warnings are not counted as errors");
  });

  runner.runTest("Provision failure fails only this unit", [&]() {
    PipelineFixture f(memoryRows(10), ErrorStrategy::Pause, 5, 5);
    f.destination.failProvision.insert(ORDERS.target);

    runner.assertEquals("failed", pipelineOutcomeToString(f.run()),
                        "Unit fails");
    runner.assertEquals("failed", unitStatusToString(f.state().status),
                        "Status failed");
    runner.assertNotEmpty(f.state().errorMessage, "Error message kept");
    runner.assertFalse(f.errors->haltRequested(),
                       "Provision errors never halt the task");
    runner.assertEquals(0, f.destination.batchSizes(ORDERS.target).size(),
                        "Nothing written");
  });

  runner.runTest("Missing source unit fails with a schema error", [&]() {
    PipelineFixture f(memoryRows(1), ErrorStrategy::Skip, 5, 5);
    f.runtimes = std::make_unique<UnitRuntimeTable>(
        std::vector<SyncUnit>{{"shop.missing", "shop_missing"}});
    f.ctx.runtimes = f.runtimes.get();

    runner.assertEquals("failed", pipelineOutcomeToString(f.run()),
                        "Unit fails");
    auto entries = f.errors->entries();
    runner.assertTrue(!entries.empty() &&
                          entries.back().kind == ErrorKind::Schema,
                      "Schema error logged");
  });

  runner.runTest("Stop between batches ends the unit without completing",
                 [&]() {
    PipelineFixture f(memoryRows(3000), ErrorStrategy::Skip, 1000, 1000);
    f.destination.beforeWrite = [&f](const std::string &, size_t call) {
      if (call == 1)
        f.signals.requestStop();
    };
    runner.assertEquals("stopped", pipelineOutcomeToString(f.run()),
                        "Unit stopped");
    runner.assertEquals(1, f.destination.batchSizes(ORDERS.target).size(),
                        "Only the in-flight batch written");
    runner.assertEquals(1, f.source.readerCloses.load(), "Reader released");
  });

  runner.runTest("Empty source unit completes with zero records", [&]() {
    PipelineFixture f({}, ErrorStrategy::Skip, 5, 5);
    runner.assertEquals("completed", pipelineOutcomeToString(f.run()),
                        "Unit completes");
    runner.assertEquals(0, f.destination.batchSizes(ORDERS.target).size(),
                        "No write call for an empty unit");
    runner.assertEquals(1, f.destination.provisioned.size(),
                        "Destination still created");
  });

  int result = runner.printSummary();
  Logger::shutdown();
  return result;
}
