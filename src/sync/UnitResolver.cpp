#include "sync/UnitResolver.h"
#include "core/database_defaults.h"
#include "core/logger.h"
#include "utils/IndexPatternMatcher.h"
#include "utils/string_utils.h"
#include <set>
#include <stdexcept>

bool UnitResolver::isSystemDatabase(const std::string &database) {
  std::string lowered = StringUtils::toLower(database);
  for (size_t i = 0; i < DatabaseDefaults::SYSTEM_DATABASE_COUNT; ++i) {
    if (lowered == DatabaseDefaults::SYSTEM_DATABASES[i])
      return true;
  }
  return false;
}

std::string UnitResolver::indexForTable(const TaskDefinition &task,
                                        const std::string &database,
                                        const std::string &table) {
  return task.indexNameTransform.apply(
      StringUtils::toLower(database + "_" + table));
}

std::string UnitResolver::tableForIndex(const TaskDefinition &task,
                                        const std::string &index) {
  std::string database =
      task.databaseNameTransform.apply(task.target.database);
  return database + "." + StringUtils::sanitizeTableName(index);
}

std::vector<SyncUnit> UnitResolver::resolve(const TaskDefinition &task,
                                            IUnitSource &source) {
  std::vector<SyncUnit> units;

  if (task.source.kind == EndpointKind::MySQL) {
    for (const auto &selection : task.databases) {
      if (isSystemDatabase(selection.database)) {
        Logger::warning(LogCategory::CONFIG, "UnitResolver",
                        "Skipping system database " + selection.database);
        continue;
      }
      std::vector<std::string> tables = selection.tables;
      if (tables.empty()) {
        tables = source.listUnits(selection.database);
        Logger::info(LogCategory::CONFIG, "UnitResolver",
                     selection.database + ": selected all " +
                         std::to_string(tables.size()) + " tables");
      }
      for (const auto &table : tables) {
        units.push_back({selection.database + "." + table,
                         indexForTable(task, selection.database, table)});
      }
    }
  } else {
    std::vector<std::string> available = source.listUnits("");
    for (const auto &pattern : task.indexPatterns) {
      if (IndexPatternMatcher::match(pattern, available).empty()) {
        Logger::warning(LogCategory::CONFIG, "UnitResolver",
                        "Index pattern '" + pattern + "' matched nothing");
      }
    }
    for (const auto &index :
         IndexPatternMatcher::expand(task.indexPatterns, available)) {
      units.push_back({index, tableForIndex(task, index)});
    }
  }

  if (units.empty()) {
    throw std::invalid_argument("Task '" + task.taskId +
                                "' selects no tables or indices");
  }

  std::set<std::string> targets;
  for (const auto &unit : units) {
    if (!targets.insert(unit.target).second) {
      throw std::invalid_argument("Two selected units would both write " +
                                  unit.target);
    }
  }
  return units;
}
