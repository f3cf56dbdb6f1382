#ifndef DATABASE_ENGINE_H
#define DATABASE_ENGINE_H

#include "core/Config.h"
#include "core/sync_config.h"
#include "core/sync_errors.h"
#include "engines/data_record.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Position of the next page a reader will return. offset counts records
// already consumed; cursor is an engine-specific continuation token (last
// primary key, or point-in-time id plus sort values).
struct ReadCheckpoint {
  uint64_t offset = 0;
  std::string cursor;

  bool isStart() const { return offset == 0 && cursor.empty(); }
};

struct RecordFailure {
  size_t index = 0;
  RecordFailureKind kind = RecordFailureKind::Unknown;
  std::string message;
};

// Outcome of one bulk write. Records not listed in failures were applied.
struct WriteResult {
  size_t attempted = 0;
  std::vector<RecordFailure> failures;

  size_t succeeded() const { return attempted - failures.size(); }
  bool ok() const { return failures.empty(); }
};

class IBatchReader {
public:
  virtual ~IBatchReader() = default;

  // Returns at most the configured page size. An empty page means the unit
  // is exhausted.
  virtual std::vector<Record> readPage() = 0;
  virtual bool exhausted() const = 0;
  virtual ReadCheckpoint checkpoint() const = 0;
  // Releases server-side resources once the unit is fully read. Not called
  // on pause so that the cursor stays resumable.
  virtual void close() = 0;
};

class IBatchWriter {
public:
  virtual ~IBatchWriter() = default;

  // One bulk call, no internal retries. Per-record problems are returned in
  // the result; connection loss or resource exhaustion throws SystemError.
  virtual WriteResult write(const std::vector<Record> &records) = 0;
};

class IUnitSource {
public:
  virtual ~IUnitSource() = default;

  virtual EndpointKind kind() const = 0;
  // Throws ConnectionError when the endpoint is unreachable or rejects the
  // credentials.
  virtual void ping() = 0;
  // Tables of one database, or every index when scope is empty.
  virtual std::vector<std::string> listUnits(const std::string &scope) = 0;
  // Throws SchemaError if the unit is missing or not readable.
  virtual Schema introspect(const std::string &unit) = 0;
  virtual uint64_t countRecords(const std::string &unit) = 0;
  virtual std::unique_ptr<IBatchReader>
  openReader(const std::string &unit, const Schema &schema,
             const ReadCheckpoint &from, size_t pageSize) = 0;
};

class IUnitDestination {
public:
  virtual ~IUnitDestination() = default;

  virtual EndpointKind kind() const = 0;
  virtual void ping() = 0;
  virtual size_t defaultBatchSize() const = 0;
  // Creates the unit from schema according to strategy, ensuring the
  // enclosing namespace exists. Throws ProvisionError.
  virtual void provision(const std::string &unit, const Schema &schema,
                         UnitExistsStrategy strategy) = 0;
  virtual std::unique_ptr<IBatchWriter> openWriter(const std::string &unit,
                                                   const Schema &schema) = 0;
};

#endif
