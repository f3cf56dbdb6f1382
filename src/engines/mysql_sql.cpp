#include "engines/mysql_sql.h"
#include "core/database_defaults.h"
#include "sync/TypeMapper.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <cmath>
#include <stdexcept>

QualifiedName MySQLStatementBuilder::splitUnit(const std::string &unit) {
  size_t dot = unit.find('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == unit.size())
    throw std::invalid_argument("expected database.table, got '" + unit + "'");
  return {unit.substr(0, dot), unit.substr(dot + 1)};
}

std::string MySQLStatementBuilder::qualified(const QualifiedName &name) {
  return StringUtils::escapeMySQLIdentifier(name.database) + "." +
         StringUtils::escapeMySQLIdentifier(name.table);
}

// Same escapes as mysql_real_escape_string for utf8mb4.
std::string MySQLStatementBuilder::quoteLiteral(const std::string &text) {
  std::string quoted;
  quoted.reserve(text.size() + 2);
  quoted += '\'';
  for (char c : text) {
    switch (c) {
    case '\0':
      quoted += "\\0";
      break;
    case '\n':
      quoted += "\\n";
      break;
    case '\r':
      quoted += "\\r";
      break;
    case '\\':
      quoted += "\\\\";
      break;
    case '\'':
      quoted += "\\'";
      break;
    case '"':
      quoted += "\\\"";
      break;
    case '\032':
      quoted += "\\Z";
      break;
    default:
      quoted += c;
    }
  }
  quoted += '\'';
  return quoted;
}

std::string MySQLStatementBuilder::literal(const FieldValue &value) {
  switch (value.kind()) {
  case FieldKind::Null:
    return "NULL";
  case FieldKind::Integer:
    return std::to_string(value.asInteger());
  case FieldKind::Float:
    if (!std::isfinite(value.asFloat()))
      return "NULL";
    return nlohmann::json(value.asFloat()).dump();
  case FieldKind::Boolean:
    return value.asBoolean() ? "1" : "0";
  case FieldKind::String:
    return quoteLiteral(value.asString());
  case FieldKind::Bytes: {
    static const char hex[] = "0123456789ABCDEF";
    const std::string &raw = value.asBytes();
    std::string out = "X'";
    out.reserve(raw.size() * 2 + 3);
    for (char c : raw) {
      unsigned char b = static_cast<unsigned char>(c);
      out += hex[b >> 4];
      out += hex[b & 0x0F];
    }
    out += '\'';
    return out;
  }
  case FieldKind::Timestamp:
    return quoteLiteral(
        TimeUtils::formatDateTimeMicros(value.asTimestamp(), ' ', false));
  case FieldKind::Object:
    return quoteLiteral(value.asObject().dump());
  }
  return "NULL";
}

std::string MySQLStatementBuilder::listTables(const std::string &database) {
  return "SELECT TABLE_NAME FROM information_schema.TABLES "
         "WHERE TABLE_SCHEMA = " +
         quoteLiteral(database) +
         " AND TABLE_TYPE = 'BASE TABLE' ORDER BY TABLE_NAME";
}

// COLUMN_TYPE keeps length, precision, enum members and UNSIGNED, which
// DATA_TYPE drops.
std::string MySQLStatementBuilder::listColumns(const QualifiedName &name) {
  return "SELECT COLUMN_NAME, COLUMN_TYPE, IS_NULLABLE, COLUMN_KEY "
         "FROM information_schema.COLUMNS WHERE TABLE_SCHEMA = " +
         quoteLiteral(name.database) +
         " AND TABLE_NAME = " + quoteLiteral(name.table) +
         " ORDER BY ORDINAL_POSITION";
}

std::string MySQLStatementBuilder::databaseCharset(const std::string &database) {
  return "SELECT DEFAULT_CHARACTER_SET_NAME, DEFAULT_COLLATION_NAME "
         "FROM information_schema.SCHEMATA WHERE SCHEMA_NAME = " +
         quoteLiteral(database);
}

std::string MySQLStatementBuilder::tableExists(const QualifiedName &name) {
  return "SELECT COUNT(*) FROM information_schema.TABLES "
         "WHERE TABLE_SCHEMA = " +
         quoteLiteral(name.database) +
         " AND TABLE_NAME = " + quoteLiteral(name.table);
}

std::string MySQLStatementBuilder::countRows(const QualifiedName &name) {
  return "SELECT COUNT(*) FROM " + qualified(name);
}

MySQLPagination MySQLStatementBuilder::paginationFor(const Schema &schema) {
  if (!schema.primaryKey.empty()) {
    const Column *pk = schema.findColumn(schema.primaryKey);
    if (pk) {
      switch (TypeMapper::classifyMySQL(pk->nativeType).typeClass) {
      case MySqlTypeClass::BigInt:
      case MySqlTypeClass::Int:
      case MySqlTypeClass::MediumInt:
      case MySqlTypeClass::SmallInt:
      case MySqlTypeClass::TinyInt:
        return MySQLPagination::Keyset;
      default:
        break;
      }
    }
  }
  for (const auto &column : schema.columns) {
    if (column.isPrimaryKey)
      return MySQLPagination::OrderedOffset;
  }
  return MySQLPagination::Offset;
}

/*
 * Page query for one reader position. Spatial columns are selected as
 * GeoJSON so they arrive as text the type mapper can parse. For keyset
 * pagination the cursor holds the last primary key value read; offset is
 * only used by the two offset modes.
 */
std::string MySQLStatementBuilder::selectPage(const QualifiedName &name,
                                              const Schema &schema,
                                              const ReadCheckpoint &from,
                                              size_t pageSize) {
  std::string sql = "SELECT ";
  for (size_t i = 0; i < schema.columns.size(); ++i) {
    const Column &column = schema.columns[i];
    std::string quoted = StringUtils::escapeMySQLIdentifier(column.name);
    if (i > 0)
      sql += ", ";
    if (TypeMapper::classifyMySQL(column.nativeType).typeClass ==
        MySqlTypeClass::Spatial)
      sql += "ST_AsGeoJSON(" + quoted + ") AS " + quoted;
    else
      sql += quoted;
  }
  sql += " FROM " + qualified(name);

  switch (paginationFor(schema)) {
  case MySQLPagination::Keyset: {
    std::string pk = StringUtils::escapeMySQLIdentifier(schema.primaryKey);
    if (!from.cursor.empty()) {
      if (!StringUtils::isSignedInteger(from.cursor))
        throw std::invalid_argument("keyset cursor is not an integer: " +
                                    from.cursor);
      sql += " WHERE " + pk + " > " + from.cursor;
    }
    sql += " ORDER BY " + pk + " LIMIT " + std::to_string(pageSize);
    break;
  }
  case MySQLPagination::OrderedOffset: {
    std::string order;
    for (const auto &column : schema.columns) {
      if (!column.isPrimaryKey)
        continue;
      if (!order.empty())
        order += ", ";
      order += StringUtils::escapeMySQLIdentifier(column.name);
    }
    sql += " ORDER BY " + order + " LIMIT " + std::to_string(pageSize) +
           " OFFSET " + std::to_string(from.offset);
    break;
  }
  case MySQLPagination::Offset:
    sql += " LIMIT " + std::to_string(pageSize) + " OFFSET " +
           std::to_string(from.offset);
    break;
  }
  return sql;
}

std::string MySQLStatementBuilder::createDatabase(const std::string &database,
                                                  const std::string &charset,
                                                  const std::string &collation) {
  std::string cs = charset.empty() ? DatabaseDefaults::DEFAULT_CHARSET : charset;
  std::string sql = "CREATE DATABASE IF NOT EXISTS " +
                    StringUtils::escapeMySQLIdentifier(database) +
                    " CHARACTER SET " + cs;
  if (!collation.empty())
    sql += " COLLATE " + collation;
  else if (charset.empty())
    sql += std::string(" COLLATE ") + DatabaseDefaults::DEFAULT_COLLATION;
  return sql;
}

std::string MySQLStatementBuilder::createTable(const QualifiedName &name,
                                               const Schema &schema) {
  if (schema.columns.empty())
    throw std::invalid_argument("cannot create " + name.table +
                                " without columns");
  std::string sql = "CREATE TABLE " + qualified(name) + " (";
  for (size_t i = 0; i < schema.columns.size(); ++i) {
    const Column &column = schema.columns[i];
    if (i > 0)
      sql += ", ";
    sql += StringUtils::escapeMySQLIdentifier(column.name) + " " +
           column.nativeType;
    if (!column.nullable || column.isPrimaryKey)
      sql += " NOT NULL";
  }
  if (!schema.primaryKey.empty())
    sql += ", PRIMARY KEY (" +
           StringUtils::escapeMySQLIdentifier(schema.primaryKey) + ")";

  std::string charset =
      schema.charset.empty() ? DatabaseDefaults::DEFAULT_CHARSET : schema.charset;
  std::string collation = schema.collation.empty() && schema.charset.empty()
                              ? DatabaseDefaults::DEFAULT_COLLATION
                              : schema.collation;
  sql += ") ENGINE=InnoDB DEFAULT CHARSET=" + charset;
  if (!collation.empty())
    sql += " COLLATE=" + collation;
  return sql;
}

std::string MySQLStatementBuilder::dropTable(const QualifiedName &name) {
  return "DROP TABLE IF EXISTS " + qualified(name);
}

std::string MySQLStatementBuilder::truncateTable(const QualifiedName &name) {
  return "TRUNCATE TABLE " + qualified(name);
}

std::string MySQLStatementBuilder::backupTableName(const std::string &table,
                                                   const std::string &timestamp) {
  std::string suffix = "_backup_" + timestamp;
  size_t room = DatabaseDefaults::MAX_TABLE_NAME_LENGTH > suffix.size()
                    ? DatabaseDefaults::MAX_TABLE_NAME_LENGTH - suffix.size()
                    : 0;
  return table.substr(0, room) + suffix;
}

std::string MySQLStatementBuilder::renameTable(const QualifiedName &from,
                                               const QualifiedName &to) {
  return "RENAME TABLE " + qualified(from) + " TO " + qualified(to);
}

std::string MySQLStatementBuilder::insertRows(const QualifiedName &name,
                                              const std::vector<Column> &columns,
                                              const std::vector<Record> &records) {
  std::string sql = "INSERT INTO " + qualified(name) + " (";
  for (size_t i = 0; i < columns.size(); ++i) {
    if (i > 0)
      sql += ", ";
    sql += StringUtils::escapeMySQLIdentifier(columns[i].name);
  }
  sql += ") VALUES ";
  for (size_t r = 0; r < records.size(); ++r) {
    if (r > 0)
      sql += ", ";
    sql += '(';
    for (size_t i = 0; i < columns.size(); ++i) {
      if (i > 0)
        sql += ", ";
      const FieldValue *value = records[r].get(columns[i].name);
      sql += value ? literal(*value) : "NULL";
    }
    sql += ')';
  }
  return sql;
}

std::string MySQLStatementBuilder::sessionSetup(int timeoutSeconds) {
  std::string timeout = std::to_string(timeoutSeconds);
  return "SET SESSION wait_timeout = " + timeout +
         ", net_read_timeout = " + timeout +
         ", net_write_timeout = " + timeout +
         ", lock_wait_timeout = " + timeout +
         ", sql_mode = 'STRICT_ALL_TABLES,NO_ENGINE_SUBSTITUTION'";
}

MySQLErrorClass classifyMySQLError(unsigned int errorCode) {
  switch (errorCode) {
  case 1062: // duplicate entry
  case 1451: // foreign key, parent row
  case 1452: // foreign key, child row
  case 1048: // column cannot be null
  case 1364: // field has no default
    return MySQLErrorClass::ConstraintViolation;
  case 1264: // out of range
  case 1366: // incorrect value
  case 1292: // incorrect datetime
  case 1265: // data truncated
  case 3140: // invalid JSON
    return MySQLErrorClass::TypeMismatch;
  case 1406: // data too long
  case 1153: // max_allowed_packet
    return MySQLErrorClass::SizeLimit;
  case 1044: // database access denied
  case 1045: // access denied
  case 2002: // local socket
  case 2003: // cannot connect
  case 2005: // unknown host
    return MySQLErrorClass::Connection;
  case 3:    // error writing file
  case 1021: // disk full
  case 1037: // out of memory
  case 1038: // out of sort memory
  case 1041: // out of memory
  case 1114: // table is full
  case 2006: // server gone away
  case 2008: // client out of memory
  case 2013: // lost connection
    return MySQLErrorClass::Resource;
  default:
    return MySQLErrorClass::Other;
  }
}

RecordFailureKind toRecordFailureKind(MySQLErrorClass errorClass) {
  switch (errorClass) {
  case MySQLErrorClass::ConstraintViolation:
    return RecordFailureKind::ConstraintViolation;
  case MySQLErrorClass::TypeMismatch:
    return RecordFailureKind::TypeMismatch;
  case MySQLErrorClass::SizeLimit:
    return RecordFailureKind::SizeLimit;
  default:
    return RecordFailureKind::Unknown;
  }
}
