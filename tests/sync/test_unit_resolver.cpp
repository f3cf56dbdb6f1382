#include "core/logger.h"
#include "fixtures/memory_engine.h"
#include "sync/UnitResolver.h"
#include "test_runner.h"

namespace {

TaskDefinition mysqlTask() {
  TaskDefinition task;
  task.taskId = "resolve";
  task.source.kind = EndpointKind::MySQL;
  task.target.kind = EndpointKind::Elasticsearch;
  return task;
}

TaskDefinition searchTask() {
  TaskDefinition task;
  task.taskId = "resolve";
  task.source.kind = EndpointKind::Elasticsearch;
  task.target.kind = EndpointKind::MySQL;
  task.target.database = "archive";
  return task;
}

} // namespace

int main() {
  TestRunner runner;
  Logger::setLogLevel(LogLevel::ERROR);
  runner.printHeader("UNIT RESOLVER");

  runner.runTest("Index names from tables", [&]() {
    TaskDefinition task = mysqlTask();
    runner.assertEquals("orders_db_customers",
                        UnitResolver::indexForTable(task, "orders_db",
                                                    "Customers"),
                        "Lowercased and joined");
    task.indexNameTransform = {true, TransformMode::Prefix, "orders_db_",
                               "prod_"};
    runner.assertEquals("prod_customers",
                        UnitResolver::indexForTable(task, "orders_db",
                                                    "Customers"),
                        "Transform applied");
  });

  runner.runTest("Table names from indices", [&]() {
    TaskDefinition task = searchTask();
    runner.assertEquals("archive.logs-2024_01",
                        UnitResolver::tableForIndex(task, "logs-2024.01"),
                        "Dots replaced");
    task.databaseNameTransform = {true, TransformMode::Suffix, "archive",
                                  "archive_v2"};
    runner.assertEquals("archive_v2.audit",
                        UnitResolver::tableForIndex(task, "audit"),
                        "Database transform applied");
  });

  runner.runTest("Whole databases expand to their tables", [&]() {
    MemorySource source;
    source.addUnit("shop.orders", memoryTableSchema(), {});
    source.addUnit("shop.customers", memoryTableSchema(), {});
    source.addUnit("crm.users", memoryTableSchema(), {});

    TaskDefinition task = mysqlTask();
    task.databases.push_back({"shop", {}});
    task.databases.push_back({"crm", {"users"}});
    task.databases.push_back({"mysql", {}});
    std::vector<SyncUnit> units = UnitResolver::resolve(task, source);
    runner.assertEquals(3, units.size(), "System database skipped");
    runner.assertEquals("shop.customers", units[0].source, "Listed order");
    runner.assertEquals("shop_customers", units[0].target, "Index name");
    runner.assertEquals("crm_users", units[2].target, "Explicit table");
  });

  runner.runTest("Index patterns expand against the cluster", [&]() {
    MemorySource source(EndpointKind::Elasticsearch);
    source.addUnit("logs-a", memoryTableSchema(), {});
    source.addUnit("logs-b", memoryTableSchema(), {});
    source.addUnit("metrics", memoryTableSchema(), {});

    TaskDefinition task = searchTask();
    task.indexPatterns = {"logs-*", "logs-a", "missing-*", "metrics"};
    std::vector<SyncUnit> units = UnitResolver::resolve(task, source);
    runner.assertEquals(3, units.size(), "Duplicates collapsed");
    runner.assertEquals("archive.metrics", units[2].target, "Target table");
  });

  runner.runTest("Empty selections and target clashes are rejected", [&]() {
    MemorySource source(EndpointKind::Elasticsearch);
    source.addUnit("logs.a", memoryTableSchema(), {});
    source.addUnit("logs_a", memoryTableSchema(), {});

    TaskDefinition nothing = searchTask();
    nothing.indexPatterns = {"absent-*"};
    runner.assertThrows<std::invalid_argument>(
        [&]() { UnitResolver::resolve(nothing, source); }, "Nothing selected");

    TaskDefinition clash = searchTask();
    clash.indexPatterns = {"logs*"};
    runner.assertThrows<std::invalid_argument>(
        [&]() { UnitResolver::resolve(clash, source); },
        "logs.a and logs_a both become archive.logs_a");

    MemorySource tables;
    TaskDefinition onlySystem = mysqlTask();
    onlySystem.databases.push_back({"information_schema", {}});
    runner.assertThrows<std::invalid_argument>(
        [&]() { UnitResolver::resolve(onlySystem, tables); },
        "Only system databases");
  });

  runner.runTest("System database detection", [&]() {
    runner.assertTrue(UnitResolver::isSystemDatabase("Performance_Schema"),
                      "Case insensitive");
    runner.assertFalse(UnitResolver::isSystemDatabase("shop"), "User database");
  });

  return runner.printSummary();
}
