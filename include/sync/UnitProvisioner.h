#ifndef UNIT_PROVISIONER_H
#define UNIT_PROVISIONER_H

#include "core/sync_config.h"
#include "engines/database_engine.h"
#include "sync/ErrorSink.h"
#include "sync/UnitRuntime.h"
#include <memory>
#include <string>

struct UnitSchemas {
  std::shared_ptr<const Schema> source;
  std::shared_ptr<const Schema> destination;
};

// Prepares one unit for transfer: checks its names, introspects the source
// and recreates the destination from the mapped schema.
class UnitProvisioner {
  IUnitSource &source_;
  IUnitDestination &destination_;
  ErrorSink &errors_;
  UnitExistsStrategy strategy_;

public:
  UnitProvisioner(IUnitSource &source, IUnitDestination &destination,
                  ErrorSink &errors, UnitExistsStrategy strategy);

  // "db.table" for MySQL, a plain index name for Elasticsearch. Throws
  // SchemaError naming the offending part.
  static void validateUnitName(const std::string &name, EndpointKind kind);

  // Throws SchemaError. Unknown column types are logged as warnings.
  UnitSchemas describe(const SyncUnit &unit);

  // Throws ProvisionError; nothing has been transferred when it does.
  void provision(const SyncUnit &unit, const Schema &destinationSchema);
};

#endif
