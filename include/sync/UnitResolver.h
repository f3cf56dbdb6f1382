#ifndef UNIT_RESOLVER_H
#define UNIT_RESOLVER_H

#include "core/Config.h"
#include "engines/database_engine.h"
#include "sync/UnitRuntime.h"
#include <string>
#include <vector>

// Turns a task's selection into concrete source/target unit pairs.
class UnitResolver {
public:
  // Lists tables or indices on the source to expand empty table lists and
  // wildcard patterns. Throws std::invalid_argument when nothing is selected
  // or two sources would write the same target.
  static std::vector<SyncUnit> resolve(const TaskDefinition &task,
                                       IUnitSource &source);

  // orders_db.Customers -> index "orders_db_customers", then the index
  // name transform.
  static std::string indexForTable(const TaskDefinition &task,
                                   const std::string &database,
                                   const std::string &table);

  // index "logs-2024.01" -> "<target db>.logs-2024_01", with the database
  // name transform applied to the target database.
  static std::string tableForIndex(const TaskDefinition &task,
                                   const std::string &index);

  static bool isSystemDatabase(const std::string &database);
};

#endif
