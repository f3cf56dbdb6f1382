#include "engines/mysql_engine.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <chrono>
#include <thread>

namespace {

[[noreturn]] void raiseMySQLError(unsigned int code, const std::string &text,
                                  ErrorKind fallback, const std::string &unit,
                                  const std::string &operation) {
  std::string message =
      "MySQL error " + std::to_string(code) + ": " + text;
  switch (classifyMySQLError(code)) {
  case MySQLErrorClass::Connection:
    throw ConnectionError(message, unit, operation);
  case MySQLErrorClass::Resource:
    throw SystemError(message, unit, operation);
  default:
    break;
  }
  switch (fallback) {
  case ErrorKind::Connection:
    throw ConnectionError(message, unit, operation);
  case ErrorKind::Schema:
    throw SchemaError(message, unit, operation);
  case ErrorKind::Provision:
    throw ProvisionError(message, unit, operation);
  case ErrorKind::Data:
    throw DataError(message, unit, operation);
  case ErrorKind::System:
    break;
  }
  throw SystemError(message, unit, operation);
}

[[noreturn]] void raiseMySQLError(MYSQL *conn, ErrorKind fallback,
                                  const std::string &unit,
                                  const std::string &operation) {
  raiseMySQLError(mysql_errno(conn), mysql_error(conn), fallback, unit,
                  operation);
}

bool isBinaryField(const MYSQL_FIELD &field) {
  if (field.type == MYSQL_TYPE_BIT)
    return true;
  if (field.charsetnr != 63)
    return false;
  switch (field.type) {
  case MYSQL_TYPE_STRING:
  case MYSQL_TYPE_VAR_STRING:
  case MYSQL_TYPE_VARCHAR:
  case MYSQL_TYPE_TINY_BLOB:
  case MYSQL_TYPE_BLOB:
  case MYSQL_TYPE_MEDIUM_BLOB:
  case MYSQL_TYPE_LONG_BLOB:
  case MYSQL_TYPE_GEOMETRY:
    return true;
  default:
    return false;
  }
}

} // namespace

MySQLConnection::MySQLConnection(const EndpointConfig &endpoint) {
  conn_ = mysql_init(nullptr);
  if (!conn_) {
    lastError_ = "mysql_init() failed";
    Logger::error(LogCategory::DATABASE, "MySQLConnection", lastError_);
    return;
  }

  unsigned int connectTimeout = DatabaseDefaults::CONNECT_TIMEOUT_SECONDS;
  unsigned int ioTimeout = DatabaseDefaults::MYSQL_TIMEOUT_SECONDS;
  mysql_options(conn_, MYSQL_OPT_CONNECT_TIMEOUT, &connectTimeout);
  mysql_options(conn_, MYSQL_OPT_READ_TIMEOUT, &ioTimeout);
  mysql_options(conn_, MYSQL_OPT_WRITE_TIMEOUT, &ioTimeout);
  mysql_options(conn_, MYSQL_SET_CHARSET_NAME,
                DatabaseDefaults::DEFAULT_CHARSET);

  const char *database =
      endpoint.database.empty() ? nullptr : endpoint.database.c_str();
  if (mysql_real_connect(conn_, endpoint.host.c_str(), endpoint.user.c_str(),
                         endpoint.password.c_str(), database,
                         static_cast<unsigned int>(endpoint.resolvedPort()),
                         nullptr, 0) == nullptr) {
    lastErrno_ = mysql_errno(conn_);
    lastError_ = mysql_error(conn_);
    Logger::error(LogCategory::DATABASE, "MySQLConnection",
                  "Connection failed: " + lastError_);
    mysql_close(conn_);
    conn_ = nullptr;
  }
}

MySQLConnection::~MySQLConnection() {
  if (conn_)
    mysql_close(conn_);
}

MySQLConnection::MySQLConnection(MySQLConnection &&other) noexcept
    : conn_(other.conn_), lastError_(std::move(other.lastError_)),
      lastErrno_(other.lastErrno_) {
  other.conn_ = nullptr;
}

MySQLConnection &MySQLConnection::operator=(MySQLConnection &&other) noexcept {
  if (this != &other) {
    if (conn_)
      mysql_close(conn_);
    conn_ = other.conn_;
    lastError_ = std::move(other.lastError_);
    lastErrno_ = other.lastErrno_;
    other.conn_ = nullptr;
  }
  return *this;
}

MySQLEndpoint::MySQLEndpoint(EndpointConfig endpoint)
    : endpoint_(std::move(endpoint)) {}

std::unique_ptr<MySQLConnection> MySQLEndpoint::createConnection() const {
  const int MAX_RETRIES = 3;
  const int INITIAL_BACKOFF_MS = 100;

  std::string lastError;
  for (int attempt = 1; attempt <= MAX_RETRIES; ++attempt) {
    auto conn = std::make_unique<MySQLConnection>(endpoint_);
    if (conn->isValid()) {
      setSessionOptions(conn->get());
      if (attempt > 1) {
        Logger::info(LogCategory::DATABASE, "MySQLEndpoint",
                     "Connection successful on attempt " +
                         std::to_string(attempt));
      }
      return conn;
    }
    lastError = conn->lastError();

    // Rejected credentials will not improve with retries.
    if (conn->lastErrno() == 1045 || conn->lastErrno() == 1044)
      break;

    if (attempt < MAX_RETRIES) {
      int backoffMs = INITIAL_BACKOFF_MS * (1 << (attempt - 1));
      Logger::warning(LogCategory::DATABASE, "MySQLEndpoint",
                      "Connection attempt " + std::to_string(attempt) +
                          " failed, retrying in " + std::to_string(backoffMs) +
                          "ms...");
      std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
    }
  }

  throw ConnectionError("cannot connect to " + endpoint_.toSafeString() +
                            ": " + lastError,
                        "", "connect");
}

void MySQLEndpoint::setSessionOptions(MYSQL *conn) const {
  std::string query = MySQLStatementBuilder::sessionSetup(
      DatabaseDefaults::MYSQL_TIMEOUT_SECONDS);
  if (mysql_query(conn, query.c_str())) {
    Logger::warning(LogCategory::DATABASE, "MySQLEndpoint",
                    "Failed to set session options: " +
                        std::string(mysql_error(conn)));
  }
}

std::vector<std::vector<std::string>>
MySQLEndpoint::executeQuery(MYSQL *conn, const std::string &query,
                            ErrorKind fallback, const std::string &unit,
                            const std::string &operation) const {
  std::vector<std::vector<std::string>> results;
  if (mysql_real_query(conn, query.data(), query.size()))
    raiseMySQLError(conn, fallback, unit, operation);

  MYSQL_RES *res = mysql_store_result(conn);
  if (!res) {
    if (mysql_field_count(conn) > 0)
      raiseMySQLError(conn, fallback, unit, operation);
    return results;
  }

  unsigned int numFields = mysql_num_fields(res);
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res))) {
    std::vector<std::string> rowData;
    rowData.reserve(numFields);
    for (unsigned int i = 0; i < numFields; ++i) {
      rowData.push_back(row[i] ? row[i] : "");
    }
    results.push_back(std::move(rowData));
  }
  mysql_free_result(res);
  return results;
}

void MySQLEndpoint::executeStatement(MYSQL *conn, const std::string &statement,
                                     ErrorKind fallback,
                                     const std::string &unit,
                                     const std::string &operation) const {
  Logger::debug(LogCategory::DATABASE, "MySQLEndpoint", statement);
  if (mysql_real_query(conn, statement.data(), statement.size()))
    raiseMySQLError(conn, fallback, unit, operation);
}

void MySQLEndpoint::pingServer() const {
  auto conn = createConnection();
  if (mysql_ping(conn->get()) != 0)
    raiseMySQLError(conn->get(), ErrorKind::Connection, "", "ping");
  Logger::info(LogCategory::DATABASE, "MySQLEndpoint",
               "Connected to " + endpoint_.toSafeString() + " (server " +
                   mysql_get_server_info(conn->get()) + ")");
}

MySQLBatchReader::MySQLBatchReader(std::unique_ptr<MySQLConnection> connection,
                                   QualifiedName name, Schema schema,
                                   const ReadCheckpoint &from, size_t pageSize)
    : connection_(std::move(connection)), name_(std::move(name)),
      schema_(std::move(schema)), pageSize_(pageSize),
      pagination_(MySQLStatementBuilder::paginationFor(schema_)), next_(from) {
  for (size_t i = 0; i < schema_.columns.size(); ++i) {
    if (schema_.columns[i].name == schema_.primaryKey)
      keyIndex_ = i;
  }
}

/*
 * Reads one page at next_ and advances it. Cells arrive as text or, for
 * binary columns, raw bytes; the type mapper gives them their final type.
 * A short page means the table is exhausted; an empty page always does.
 */
std::vector<Record> MySQLBatchReader::readPage() {
  std::vector<Record> page;
  if (exhausted_)
    return page;
  std::string unit = name_.database + "." + name_.table;
  if (!connection_)
    throw SystemError("reader already closed", unit, "read");

  MYSQL *conn = connection_->get();
  std::string query =
      MySQLStatementBuilder::selectPage(name_, schema_, next_, pageSize_);
  if (mysql_real_query(conn, query.data(), query.size()))
    raiseMySQLError(conn, ErrorKind::Schema, unit, "read");

  MYSQL_RES *res = mysql_store_result(conn);
  if (!res)
    raiseMySQLError(conn, ErrorKind::Schema, unit, "read");

  unsigned int numFields = mysql_num_fields(res);
  MYSQL_FIELD *fields = mysql_fetch_fields(res);
  std::string lastKey;
  MYSQL_ROW row;
  page.reserve(static_cast<size_t>(mysql_num_rows(res)));
  while ((row = mysql_fetch_row(res))) {
    unsigned long *lengths = mysql_fetch_lengths(res);
    Record record;
    record.fields.reserve(numFields);
    for (unsigned int i = 0; i < numFields; ++i) {
      const std::string &column =
          i < schema_.columns.size() ? schema_.columns[i].name : fields[i].name;
      if (!row[i]) {
        record.fields.emplace_back(column, FieldValue::null());
        continue;
      }
      std::string raw(row[i], lengths[i]);
      if (i == keyIndex_ && pagination_ == MySQLPagination::Keyset)
        lastKey = raw;
      if (isBinaryField(fields[i]))
        record.fields.emplace_back(column, FieldValue::bytes(std::move(raw)));
      else
        record.fields.emplace_back(column, FieldValue::string(std::move(raw)));
    }
    page.push_back(std::move(record));
  }
  mysql_free_result(res);

  next_.offset += page.size();
  if (pagination_ == MySQLPagination::Keyset && !lastKey.empty())
    next_.cursor = lastKey;
  if (page.size() < pageSize_)
    exhausted_ = true;
  return page;
}

void MySQLBatchReader::close() { connection_.reset(); }

MySQLSource::MySQLSource(EndpointConfig endpoint)
    : MySQLEndpoint(std::move(endpoint)) {}

void MySQLSource::ping() { pingServer(); }

std::vector<std::string> MySQLSource::listUnits(const std::string &scope) {
  auto conn = createConnection();
  std::vector<std::string> tables;
  for (const auto &row :
       executeQuery(conn->get(), MySQLStatementBuilder::listTables(scope),
                    ErrorKind::Schema, scope, "list_tables")) {
    if (!row.empty())
      tables.push_back(row[0]);
  }
  return tables;
}

Schema MySQLSource::introspect(const std::string &unit) {
  QualifiedName name;
  try {
    name = MySQLStatementBuilder::splitUnit(unit);
  } catch (const std::invalid_argument &e) {
    throw SchemaError(e.what(), unit, "introspect");
  }

  auto conn = createConnection();
  auto rows =
      executeQuery(conn->get(), MySQLStatementBuilder::listColumns(name),
                   ErrorKind::Schema, unit, "introspect");
  if (rows.empty())
    throw SchemaError("table does not exist or is not readable", unit,
                      "introspect");

  Schema schema;
  schema.unitName = unit;
  std::vector<std::string> keyColumns;
  for (const auto &row : rows) {
    if (row.size() < 4)
      continue;
    Column column;
    column.name = row[0];
    column.nativeType = row[1];
    column.nullable = row[2] == "YES";
    column.isPrimaryKey = row[3] == "PRI";
    if (column.isPrimaryKey)
      keyColumns.push_back(column.name);
    schema.columns.push_back(std::move(column));
  }
  if (keyColumns.size() == 1)
    schema.primaryKey = keyColumns.front();

  auto charset = executeQuery(
      conn->get(), MySQLStatementBuilder::databaseCharset(name.database),
      ErrorKind::Schema, unit, "introspect");
  if (!charset.empty() && charset[0].size() >= 2) {
    schema.charset = charset[0][0];
    schema.collation = charset[0][1];
  }

  Logger::debug(LogCategory::SCHEMA, "MySQLSource::introspect",
                unit + ": " + std::to_string(schema.columns.size()) +
                    " columns, primary key '" + schema.primaryKey + "'");
  return schema;
}

uint64_t MySQLSource::countRecords(const std::string &unit) {
  QualifiedName name;
  try {
    name = MySQLStatementBuilder::splitUnit(unit);
  } catch (const std::invalid_argument &e) {
    throw SchemaError(e.what(), unit, "count");
  }
  auto conn = createConnection();
  auto rows = executeQuery(conn->get(), MySQLStatementBuilder::countRows(name),
                           ErrorKind::Schema, unit, "count");
  if (rows.empty() || rows[0].empty() ||
      !StringUtils::isUnsignedInteger(rows[0][0]))
    return 0;
  return std::stoull(rows[0][0]);
}

std::unique_ptr<IBatchReader>
MySQLSource::openReader(const std::string &unit, const Schema &schema,
                        const ReadCheckpoint &from, size_t pageSize) {
  return std::make_unique<MySQLBatchReader>(
      createConnection(), MySQLStatementBuilder::splitUnit(unit), schema, from,
      pageSize);
}

MySQLBatchWriter::MySQLBatchWriter(std::unique_ptr<MySQLConnection> connection,
                                   QualifiedName name,
                                   std::vector<Column> columns)
    : connection_(std::move(connection)), name_(std::move(name)),
      columns_(std::move(columns)) {}

/*
 * One multi-row INSERT per batch. InnoDB applies the statement atomically
 * under strict sql_mode, so a data error means nothing from the batch was
 * stored; the rows are then inserted one by one to find out which of them
 * are at fault. Connection loss and resource errors abort the batch with
 * SystemError, leaving the checkpoint at the previous batch.
 */
WriteResult MySQLBatchWriter::write(const std::vector<Record> &records) {
  WriteResult result;
  result.attempted = records.size();
  if (records.empty())
    return result;

  MYSQL *conn = connection_->get();
  std::string unit = name_.database + "." + name_.table;
  std::string statement =
      MySQLStatementBuilder::insertRows(name_, columns_, records);
  if (mysql_real_query(conn, statement.data(), statement.size()) == 0)
    return result;

  unsigned int code = mysql_errno(conn);
  std::string text = mysql_error(conn);
  MySQLErrorClass errorClass = classifyMySQLError(code);
  switch (errorClass) {
  case MySQLErrorClass::Connection:
  case MySQLErrorClass::Resource:
    throw SystemError("MySQL error " + std::to_string(code) + ": " + text,
                      unit, "write");
  case MySQLErrorClass::Other:
    throw DataError("MySQL error " + std::to_string(code) + ": " + text, unit,
                    "write");
  default:
    break;
  }

  if (records.size() == 1) {
    result.failures.push_back(
        {0, toRecordFailureKind(errorClass),
         "MySQL error " + std::to_string(code) + ": " + text});
    return result;
  }

  Logger::debug(LogCategory::DATABASE, "MySQLBatchWriter",
                unit + ": batch rejected (" + text + "), retrying row by row");
  return writeSingly(records);
}

WriteResult MySQLBatchWriter::writeSingly(const std::vector<Record> &records) {
  WriteResult result;
  result.attempted = records.size();
  MYSQL *conn = connection_->get();
  std::string unit = name_.database + "." + name_.table;

  std::vector<Record> single(1);
  for (size_t i = 0; i < records.size(); ++i) {
    single[0] = records[i];
    std::string statement =
        MySQLStatementBuilder::insertRows(name_, columns_, single);
    if (mysql_real_query(conn, statement.data(), statement.size()) == 0)
      continue;

    unsigned int code = mysql_errno(conn);
    MySQLErrorClass errorClass = classifyMySQLError(code);
    std::string message =
        "MySQL error " + std::to_string(code) + ": " + mysql_error(conn);
    if (errorClass == MySQLErrorClass::Connection ||
        errorClass == MySQLErrorClass::Resource)
      throw SystemError(message, unit, "write");
    result.failures.push_back({i, toRecordFailureKind(errorClass), message});
  }
  return result;
}

MySQLDestination::MySQLDestination(EndpointConfig endpoint)
    : MySQLEndpoint(std::move(endpoint)) {}

void MySQLDestination::ping() { pingServer(); }

/*
 * Destination table lifecycle. The database is created first with the
 * source charset when one is known. drop recreates the table, truncate keeps
 * an existing table and only empties it, backup renames an existing table
 * to <table>_backup_<yyyyMMddHHmmss> before creating a fresh one.
 */
void MySQLDestination::provision(const std::string &unit, const Schema &schema,
                                 UnitExistsStrategy strategy) {
  QualifiedName name;
  try {
    name = MySQLStatementBuilder::splitUnit(unit);
  } catch (const std::invalid_argument &e) {
    throw ProvisionError(e.what(), unit, "provision");
  }

  auto conn = createConnection();
  MYSQL *mysql = conn->get();
  executeStatement(mysql,
                   MySQLStatementBuilder::createDatabase(
                       name.database, schema.charset, schema.collation),
                   ErrorKind::Provision, unit, "create_database");

  auto exists =
      executeQuery(mysql, MySQLStatementBuilder::tableExists(name),
                   ErrorKind::Provision, unit, "provision");
  bool tableExists = !exists.empty() && !exists[0].empty() &&
                     exists[0][0] != "0";

  std::string createStatement;
  try {
    createStatement = MySQLStatementBuilder::createTable(name, schema);
  } catch (const std::invalid_argument &e) {
    throw ProvisionError(e.what(), unit, "create_table");
  }

  switch (strategy) {
  case UnitExistsStrategy::Drop:
    executeStatement(mysql, MySQLStatementBuilder::dropTable(name),
                     ErrorKind::Provision, unit, "drop_table");
    executeStatement(mysql, createStatement, ErrorKind::Provision, unit,
                     "create_table");
    break;
  case UnitExistsStrategy::Truncate:
    if (tableExists)
      executeStatement(mysql, MySQLStatementBuilder::truncateTable(name),
                       ErrorKind::Provision, unit, "truncate_table");
    else
      executeStatement(mysql, createStatement, ErrorKind::Provision, unit,
                       "create_table");
    break;
  case UnitExistsStrategy::Backup:
    if (tableExists) {
      QualifiedName backup{name.database,
                           MySQLStatementBuilder::backupTableName(
                               name.table, TimeUtils::getCompactTimestamp())};
      executeStatement(mysql, MySQLStatementBuilder::renameTable(name, backup),
                       ErrorKind::Provision, unit, "backup_table");
      Logger::info(LogCategory::DATABASE, "MySQLDestination::provision",
                   unit + " moved aside to " + backup.table);
    }
    executeStatement(mysql, createStatement, ErrorKind::Provision, unit,
                     "create_table");
    break;
  }
}

std::unique_ptr<IBatchWriter>
MySQLDestination::openWriter(const std::string &unit, const Schema &schema) {
  return std::make_unique<MySQLBatchWriter>(
      createConnection(), MySQLStatementBuilder::splitUnit(unit),
      schema.columns);
}
