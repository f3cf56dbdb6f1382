#ifndef MYSQL_ENGINE_H
#define MYSQL_ENGINE_H

#include "core/Config.h"
#include "core/logger.h"
#include "engines/database_engine.h"
#include "engines/mysql_sql.h"
#include <memory>
#include <mysql/mysql.h>

class MySQLConnection {
  MYSQL *conn_{nullptr};
  std::string lastError_;
  unsigned int lastErrno_ = 0;

public:
  explicit MySQLConnection(const EndpointConfig &endpoint);
  ~MySQLConnection();

  MySQLConnection(const MySQLConnection &) = delete;
  MySQLConnection &operator=(const MySQLConnection &) = delete;

  MySQLConnection(MySQLConnection &&other) noexcept;
  MySQLConnection &operator=(MySQLConnection &&other) noexcept;

  MYSQL *get() const { return conn_; }
  bool isValid() const { return conn_ != nullptr; }
  const std::string &lastError() const { return lastError_; }
  unsigned int lastErrno() const { return lastErrno_; }
};

// Connection handling shared by the source and destination side. Each
// reader and writer gets its own connection: a MYSQL handle must not be
// used from two threads.
class MySQLEndpoint {
protected:
  EndpointConfig endpoint_;

  explicit MySQLEndpoint(EndpointConfig endpoint);

  // Three attempts with exponential backoff. Throws ConnectionError.
  std::unique_ptr<MySQLConnection> createConnection() const;
  void setSessionOptions(MYSQL *conn) const;

  // Both throw a SyncError of the class the server error belongs to;
  // errors that are neither connection nor resource problems use fallback.
  std::vector<std::vector<std::string>>
  executeQuery(MYSQL *conn, const std::string &query, ErrorKind fallback,
               const std::string &unit, const std::string &operation) const;
  void executeStatement(MYSQL *conn, const std::string &statement,
                        ErrorKind fallback, const std::string &unit,
                        const std::string &operation) const;

  void pingServer() const;
};

class MySQLBatchReader : public IBatchReader {
  std::unique_ptr<MySQLConnection> connection_;
  QualifiedName name_;
  Schema schema_;
  size_t pageSize_;
  MySQLPagination pagination_;
  ReadCheckpoint next_;
  bool exhausted_ = false;
  // Column index of the keyset primary key in the select list.
  size_t keyIndex_ = 0;

public:
  MySQLBatchReader(std::unique_ptr<MySQLConnection> connection,
                   QualifiedName name, Schema schema,
                   const ReadCheckpoint &from, size_t pageSize);

  std::vector<Record> readPage() override;
  bool exhausted() const override { return exhausted_; }
  ReadCheckpoint checkpoint() const override { return next_; }
  void close() override;
};

class MySQLSource : public IUnitSource, private MySQLEndpoint {
public:
  explicit MySQLSource(EndpointConfig endpoint);

  EndpointKind kind() const override { return EndpointKind::MySQL; }
  void ping() override;
  std::vector<std::string> listUnits(const std::string &scope) override;
  Schema introspect(const std::string &unit) override;
  uint64_t countRecords(const std::string &unit) override;
  std::unique_ptr<IBatchReader> openReader(const std::string &unit,
                                           const Schema &schema,
                                           const ReadCheckpoint &from,
                                           size_t pageSize) override;
};

class MySQLBatchWriter : public IBatchWriter {
  std::unique_ptr<MySQLConnection> connection_;
  QualifiedName name_;
  std::vector<Column> columns_;

  WriteResult writeSingly(const std::vector<Record> &records);

public:
  MySQLBatchWriter(std::unique_ptr<MySQLConnection> connection,
                   QualifiedName name, std::vector<Column> columns);

  WriteResult write(const std::vector<Record> &records) override;
};

class MySQLDestination : public IUnitDestination, private MySQLEndpoint {
public:
  explicit MySQLDestination(EndpointConfig endpoint);

  EndpointKind kind() const override { return EndpointKind::MySQL; }
  void ping() override;
  size_t defaultBatchSize() const override {
    return DatabaseDefaults::MYSQL_DEFAULT_BATCH_SIZE;
  }
  void provision(const std::string &unit, const Schema &schema,
                 UnitExistsStrategy strategy) override;
  std::unique_ptr<IBatchWriter> openWriter(const std::string &unit,
                                           const Schema &schema) override;
};

#endif
