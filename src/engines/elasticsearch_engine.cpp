#include "engines/elasticsearch_engine.h"
#include "core/logger.h"
#include "utils/time_utils.h"

using json = nlohmann::json;

namespace {

std::string indexPath(const std::string &index, const std::string &suffix) {
  return "/" + ElasticsearchClient::urlEncode(index) + suffix;
}

// Maps a failed read-side response onto the error taxonomy: transport
// problems, overload and server errors are system errors, anything else the
// cluster refused is a schema problem of the unit.
[[noreturn]] void raiseReadError(const HTTPResponse &response,
                                 const std::string &unit,
                                 const std::string &operation) {
  std::string message = response.status_code == 0
                            ? response.error_message
                            : "HTTP " + std::to_string(response.status_code) +
                                  ": " +
                                  ElasticsearchCodec::errorSummary(response.body);
  if (response.status_code == 0 || response.status_code == 429 ||
      response.status_code >= 500)
    throw SystemError(message, unit, operation);
  throw SchemaError(message, unit, operation);
}

[[noreturn]] void raiseProvisionError(const HTTPResponse &response,
                                      const std::string &unit,
                                      const std::string &operation) {
  if (response.status_code == 0)
    throw SystemError(response.error_message, unit, operation);
  throw ProvisionError("HTTP " + std::to_string(response.status_code) + ": " +
                           ElasticsearchCodec::errorSummary(response.body),
                       unit, operation);
}

} // namespace

ElasticsearchEndpoint::ElasticsearchEndpoint(EndpointConfig endpoint)
    : endpoint_(std::move(endpoint)) {}

std::unique_ptr<ElasticsearchClient>
ElasticsearchEndpoint::createClient(int maxRetries) const {
  auto client = std::make_unique<ElasticsearchClient>(endpoint_);
  client->setMaxRetries(maxRetries);
  return client;
}

void ElasticsearchEndpoint::pingCluster() const {
  auto client = createClient(0);
  HTTPResponse response = client->request("GET", "/");
  if (!response.ok()) {
    throw ConnectionError("cannot reach " + endpoint_.toSafeString() + ": " +
                              response.error_message,
                          "", "ping");
  }
  std::string version;
  json info = json::parse(response.body, nullptr, false);
  if (info.is_object() && info.contains("version") &&
      info["version"].is_object())
    version = info["version"].value("number", "");
  Logger::info(LogCategory::SEARCH, "ElasticsearchEndpoint",
               "Connected to " + endpoint_.toSafeString() +
                   (version.empty() ? "" : " (version " + version + ")"));
}

ElasticsearchBatchReader::ElasticsearchBatchReader(
    std::unique_ptr<ElasticsearchClient> client, std::string index,
    const ReadCheckpoint &from, size_t pageSize)
    : client_(std::move(client)), index_(std::move(index)),
      pageSize_(pageSize), next_(from) {
  if (from.cursor.empty()) {
    openPointInTime();
    next_.cursor = cursor_.encode();
  } else {
    try {
      cursor_ = PitCursor::decode(from.cursor);
    } catch (const std::invalid_argument &e) {
      throw SchemaError(e.what(), index_, "resume");
    }
  }
}

void ElasticsearchBatchReader::openPointInTime() {
  HTTPResponse response = client_->request(
      "POST", indexPath(index_, "/_pit?keep_alive=") +
                  DatabaseDefaults::ELASTICSEARCH_PIT_KEEP_ALIVE);
  if (!response.ok())
    raiseReadError(response, index_, "open_pit");
  json parsed = json::parse(response.body, nullptr, false);
  if (!parsed.is_object() || !parsed.contains("id") ||
      !parsed["id"].is_string())
    throw SystemError("point in time response without id", index_,
                      "open_pit");
  cursor_.pitId = parsed["id"].get<std::string>();
  cursor_.after = json();
}

/*
 * search_after over the point in time. Every page refreshes the keep-alive,
 * so a paused unit stays resumable for ELASTICSEARCH_PIT_KEEP_ALIVE after
 * its last page. A resume after that fails with a 404 from the cluster,
 * which surfaces as a SchemaError on the unit.
 */
std::vector<Record> ElasticsearchBatchReader::readPage() {
  if (exhausted_)
    return {};

  json request = ElasticsearchCodec::searchRequest(
      cursor_, pageSize_, DatabaseDefaults::ELASTICSEARCH_PIT_KEEP_ALIVE);
  HTTPResponse response = client_->request("POST", "/_search", request.dump());
  if (!response.ok())
    raiseReadError(response, index_, "read");

  SearchPage page;
  try {
    page = ElasticsearchCodec::parseSearchPage(response.body);
  } catch (const std::exception &e) {
    throw SystemError(std::string("unreadable search response: ") + e.what(),
                      index_, "read");
  }

  if (!page.pitId.empty())
    cursor_.pitId = page.pitId;
  if (!page.records.empty())
    cursor_.after = page.lastSort;
  next_.offset += page.records.size();
  next_.cursor = cursor_.encode();
  if (page.records.size() < pageSize_)
    exhausted_ = true;
  return std::move(page.records);
}

void ElasticsearchBatchReader::close() {
  if (cursor_.pitId.empty())
    return;
  HTTPResponse response = client_->request(
      "DELETE", "/_pit", json{{"id", cursor_.pitId}}.dump());
  if (!response.ok() && response.status_code != 404) {
    Logger::warning(LogCategory::SEARCH, "ElasticsearchBatchReader",
                    index_ + ": could not release point in time: " +
                        response.error_message);
  }
  cursor_.pitId.clear();
}

ElasticsearchSource::ElasticsearchSource(EndpointConfig endpoint)
    : ElasticsearchEndpoint(std::move(endpoint)) {}

void ElasticsearchSource::ping() { pingCluster(); }

std::vector<std::string>
ElasticsearchSource::listUnits(const std::string & /*scope*/) {
  auto client = createClient(3);
  HTTPResponse response =
      client->request("GET", "/_cat/indices?format=json&h=index");
  if (!response.ok())
    raiseReadError(response, "", "list_indices");
  try {
    return ElasticsearchCodec::parseIndexList(response.body);
  } catch (const std::exception &e) {
    throw SystemError(std::string("unreadable index list: ") + e.what(), "",
                      "list_indices");
  }
}

Schema ElasticsearchSource::introspect(const std::string &unit) {
  auto client = createClient(3);
  HTTPResponse response = client->request("GET", indexPath(unit, "/_mapping"));
  if (response.status_code == 404)
    throw SchemaError("index does not exist", unit, "introspect");
  if (!response.ok())
    raiseReadError(response, unit, "introspect");
  try {
    Schema schema = ElasticsearchCodec::schemaFromMapping(unit, response.body);
    Logger::debug(LogCategory::SCHEMA, "ElasticsearchSource::introspect",
                  unit + ": " + std::to_string(schema.columns.size()) +
                      " top-level fields");
    return schema;
  } catch (const std::exception &e) {
    throw SchemaError(std::string("unreadable mapping: ") + e.what(), unit,
                      "introspect");
  }
}

uint64_t ElasticsearchSource::countRecords(const std::string &unit) {
  auto client = createClient(3);
  HTTPResponse response = client->request("GET", indexPath(unit, "/_count"));
  if (!response.ok())
    raiseReadError(response, unit, "count");
  try {
    return ElasticsearchCodec::parseCount(response.body);
  } catch (const std::exception &e) {
    throw SchemaError(e.what(), unit, "count");
  }
}

std::unique_ptr<IBatchReader>
ElasticsearchSource::openReader(const std::string &unit,
                                const Schema & /*schema*/,
                                const ReadCheckpoint &from, size_t pageSize) {
  return std::make_unique<ElasticsearchBatchReader>(createClient(3), unit,
                                                    from, pageSize);
}

ElasticsearchBatchWriter::ElasticsearchBatchWriter(
    std::unique_ptr<ElasticsearchClient> client, std::string index)
    : client_(std::move(client)), index_(std::move(index)) {}

/*
 * One _bulk call, sent exactly once. Item level errors become record
 * failures. A refused request is attributed to every record: 413 as a size
 * limit, 429 as a rejection. Transport failures and 5xx leave the outcome
 * unknown and abort the batch with SystemError.
 */
WriteResult ElasticsearchBatchWriter::write(const std::vector<Record> &records) {
  WriteResult result;
  result.attempted = records.size();
  if (records.empty())
    return result;

  std::string body = ElasticsearchCodec::bulkBody(index_, records);
  HTTPResponse response =
      client_->request("POST", "/_bulk", body, "application/x-ndjson");

  if (response.ok()) {
    try {
      return ElasticsearchCodec::parseBulkResponse(response.body,
                                                   records.size());
    } catch (const std::invalid_argument &e) {
      throw SystemError(e.what(), index_, "write");
    }
  }
  if (response.status_code == 413 || response.status_code == 429)
    return ElasticsearchCodec::wholeBatchFailure(response.status_code,
                                                 response.body, records.size());
  if (response.status_code == 0 || response.status_code >= 500)
    throw SystemError(response.error_message, index_, "write");
  throw DataError("bulk request rejected: " +
                      ElasticsearchCodec::errorSummary(response.body),
                  index_, "write");
}

ElasticsearchDestination::ElasticsearchDestination(EndpointConfig endpoint)
    : ElasticsearchEndpoint(std::move(endpoint)) {}

void ElasticsearchDestination::ping() { pingCluster(); }

bool ElasticsearchDestination::indexExists(ElasticsearchClient &client,
                                           const std::string &index) {
  HTTPResponse response = client.request("HEAD", indexPath(index, ""));
  if (response.status_code == 404)
    return false;
  if (!response.ok())
    raiseProvisionError(response, index, "exists");
  return true;
}

void ElasticsearchDestination::createIndex(ElasticsearchClient &client,
                                           const std::string &index,
                                           const Schema &schema) {
  json definition = ElasticsearchCodec::indexDefinition(schema);
  HTTPResponse response =
      client.request("PUT", indexPath(index, ""), definition.dump());
  if (!response.ok())
    raiseProvisionError(response, index, "create_index");
  Logger::info(LogCategory::SEARCH, "ElasticsearchDestination",
               "Created index " + index + " with " +
                   std::to_string(schema.columns.size()) + " fields");
}

/*
 * drop deletes and recreates the index with the mapped fields. truncate
 * deletes every document of an existing index and keeps its mapping.
 * backup copies an existing index to <index>_backup_<yyyyMMddHHmmss> with
 * _reindex before recreating it.
 */
void ElasticsearchDestination::provision(const std::string &unit,
                                         const Schema &schema,
                                         UnitExistsStrategy strategy) {
  auto client = createClient(3);

  switch (strategy) {
  case UnitExistsStrategy::Drop: {
    HTTPResponse response = client->request("DELETE", indexPath(unit, ""));
    if (!response.ok() && response.status_code != 404)
      raiseProvisionError(response, unit, "delete_index");
    createIndex(*client, unit, schema);
    break;
  }
  case UnitExistsStrategy::Truncate: {
    if (!indexExists(*client, unit)) {
      createIndex(*client, unit, schema);
      break;
    }
    HTTPResponse response = client->request(
        "POST",
        indexPath(unit, "/_delete_by_query?refresh=true&conflicts=proceed"),
        json{{"query", {{"match_all", json::object()}}}}.dump());
    if (!response.ok())
      raiseProvisionError(response, unit, "truncate_index");
    break;
  }
  case UnitExistsStrategy::Backup: {
    if (indexExists(*client, unit)) {
      std::string backup =
          unit + "_backup_" + TimeUtils::getCompactTimestamp();
      json body = {{"source", {{"index", unit}}}, {"dest", {{"index", backup}}}};
      HTTPResponse copy = client->request(
          "POST", "/_reindex?wait_for_completion=true&refresh=true",
          body.dump());
      if (!copy.ok())
        raiseProvisionError(copy, unit, "backup_index");
      json outcome = json::parse(copy.body, nullptr, false);
      if (outcome.is_object() && outcome.contains("failures") &&
          outcome["failures"].is_array() && !outcome["failures"].empty())
        throw ProvisionError("backup copy reported failures: " +
                                 outcome["failures"][0].dump(),
                             unit, "backup_index");
      Logger::info(LogCategory::SEARCH, "ElasticsearchDestination",
                   unit + " copied aside to " + backup);

      HTTPResponse removed = client->request("DELETE", indexPath(unit, ""));
      if (!removed.ok())
        raiseProvisionError(removed, unit, "delete_index");
    }
    createIndex(*client, unit, schema);
    break;
  }
  }
}

std::unique_ptr<IBatchWriter>
ElasticsearchDestination::openWriter(const std::string &unit,
                                     const Schema & /*schema*/) {
  return std::make_unique<ElasticsearchBatchWriter>(createClient(0), unit);
}
