#include "sync/UnitProvisioner.h"
#include "core/logger.h"
#include "sync/TypeMapper.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <new>

UnitProvisioner::UnitProvisioner(IUnitSource &source,
                                 IUnitDestination &destination,
                                 ErrorSink &errors,
                                 UnitExistsStrategy strategy)
    : source_(source), destination_(destination), errors_(errors),
      strategy_(strategy) {}

void UnitProvisioner::validateUnitName(const std::string &name,
                                       EndpointKind kind) {
  if (kind == EndpointKind::Elasticsearch) {
    if (!StringUtils::isValidIndexName(name))
      throw SchemaError("invalid index name '" + name + "'", name,
                        "validate");
    return;
  }

  size_t dot = name.find('.');
  if (dot == std::string::npos)
    throw SchemaError("table unit must be written as database.table", name,
                      "validate");
  std::string database = name.substr(0, dot);
  std::string table = name.substr(dot + 1);
  if (!StringUtils::isValidTableName(database))
    throw SchemaError("invalid database name '" + database + "'", name,
                      "validate");
  if (!StringUtils::isValidTableName(table))
    throw SchemaError("invalid table name '" + table + "'", name, "validate");
}

UnitSchemas UnitProvisioner::describe(const SyncUnit &unit) {
  validateUnitName(unit.source, source_.kind());
  validateUnitName(unit.target, destination_.kind());

  Schema sourceSchema;
  try {
    sourceSchema = source_.introspect(unit.source);
  } catch (const SyncError &) {
    throw;
  } catch (const std::bad_alloc &) {
    throw;
  } catch (const std::exception &e) {
    throw SchemaError(e.what(), unit.source, "introspect");
  }
  if (sourceSchema.columns.empty() &&
      source_.kind() == EndpointKind::MySQL)
    throw SchemaError("table has no columns", unit.source, "introspect");

  std::vector<std::string> unknownColumns;
  Schema destinationSchema = TypeMapper::toDestinationSchema(
      sourceSchema, source_.kind(), &unknownColumns);
  destinationSchema.unitName = unit.target;

  for (const auto &name : unknownColumns) {
    const Column *column = sourceSchema.findColumn(name);
    const Column *mapped = destinationSchema.findColumn(name);
    errors_.recordWarning(
        unit.source,
        "unsupported type for column '" + name + "', using " +
            (mapped ? mapped->nativeType : std::string("default")),
        {{"column", name},
         {"sourceType", column ? column->nativeType : ""},
         {"operation", "map_schema"}});
  }

  if (source_.kind() == EndpointKind::MySQL) {
    size_t keyColumns = std::count_if(
        sourceSchema.columns.begin(), sourceSchema.columns.end(),
        [](const Column &c) { return c.isPrimaryKey; });
    if (sourceSchema.primaryKey.empty()) {
      errors_.recordWarning(
          unit.source,
          keyColumns > 1
              ? "composite primary key, document ids will be generated"
              : "no primary key, document ids will be generated",
          {{"operation", "map_schema"}, {"keyColumns", keyColumns}});
    }
  }

  Logger::info(LogCategory::SCHEMA, "UnitProvisioner::describe",
               unit.source + ": " +
                   std::to_string(sourceSchema.columns.size()) +
                   " columns mapped for " + unit.target);

  UnitSchemas schemas;
  schemas.source = std::make_shared<const Schema>(std::move(sourceSchema));
  schemas.destination =
      std::make_shared<const Schema>(std::move(destinationSchema));
  return schemas;
}

void UnitProvisioner::provision(const SyncUnit &unit,
                                const Schema &destinationSchema) {
  Logger::info(LogCategory::SCHEMA, "UnitProvisioner::provision",
               "Provisioning " + unit.target + " (" +
                   unitExistsStrategyToString(strategy_) + ")");
  try {
    destination_.provision(unit.target, destinationSchema, strategy_);
  } catch (const SyncError &) {
    throw;
  } catch (const std::bad_alloc &) {
    throw;
  } catch (const std::exception &e) {
    throw ProvisionError(e.what(), unit.target, "provision");
  }
}
