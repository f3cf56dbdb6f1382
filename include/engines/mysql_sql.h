#ifndef MYSQL_SQL_H
#define MYSQL_SQL_H

#include "core/sync_errors.h"
#include "engines/data_record.h"
#include "engines/database_engine.h"
#include <string>
#include <vector>

enum class MySQLPagination {
  // WHERE pk > last ORDER BY pk, single integer primary key.
  Keyset,
  // ORDER BY every primary key column, LIMIT/OFFSET.
  OrderedOffset,
  // Plain LIMIT/OFFSET for tables without a primary key.
  Offset
};

enum class MySQLErrorClass {
  ConstraintViolation,
  TypeMismatch,
  SizeLimit,
  // Server unreachable, credentials rejected.
  Connection,
  // Lost connection, out of memory, disk full.
  Resource,
  Other
};

struct QualifiedName {
  std::string database;
  std::string table;
};

// Text of every statement the MySQL engine sends. No connection is needed,
// so identifier quoting and literal escaping assume utf8mb4 and a session
// without NO_BACKSLASH_ESCAPES, which the engine sets up itself.
class MySQLStatementBuilder {
public:
  // "db.table" -> {db, table}. Throws std::invalid_argument without a dot.
  static QualifiedName splitUnit(const std::string &unit);
  static std::string qualified(const QualifiedName &name);

  static std::string quoteLiteral(const std::string &text);
  static std::string literal(const FieldValue &value);

  static std::string listTables(const std::string &database);
  static std::string listColumns(const QualifiedName &name);
  static std::string databaseCharset(const std::string &database);
  static std::string tableExists(const QualifiedName &name);
  static std::string countRows(const QualifiedName &name);

  static MySQLPagination paginationFor(const Schema &schema);
  static std::string selectPage(const QualifiedName &name,
                                const Schema &schema,
                                const ReadCheckpoint &from, size_t pageSize);

  static std::string createDatabase(const std::string &database,
                                    const std::string &charset,
                                    const std::string &collation);
  static std::string createTable(const QualifiedName &name,
                                 const Schema &schema);
  static std::string dropTable(const QualifiedName &name);
  static std::string truncateTable(const QualifiedName &name);
  // Backup table name, shortened so the result stays a legal identifier.
  static std::string backupTableName(const std::string &table,
                                     const std::string &timestamp);
  static std::string renameTable(const QualifiedName &from,
                                 const QualifiedName &to);

  // Multi-row INSERT over the given columns; fields a record lacks are
  // written as NULL, fields outside columns are ignored.
  static std::string insertRows(const QualifiedName &name,
                                const std::vector<Column> &columns,
                                const std::vector<Record> &records);

  static std::string sessionSetup(int timeoutSeconds);
};

MySQLErrorClass classifyMySQLError(unsigned int errorCode);
// Only the three data classes map onto a record failure kind.
RecordFailureKind toRecordFailureKind(MySQLErrorClass errorClass);

#endif
