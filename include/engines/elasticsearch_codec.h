#ifndef ELASTICSEARCH_CODEC_H
#define ELASTICSEARCH_CODEC_H

#include "engines/data_record.h"
#include "engines/database_engine.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct SearchPage {
  std::vector<Record> records;
  // The point in time id may change between pages; always use the latest.
  std::string pitId;
  // Sort values of the last hit, null when the page was empty.
  nlohmann::json lastSort;
};

// Reader position inside a point in time: the PIT id plus the sort values
// of the last hit already returned (null before the first page).
struct PitCursor {
  std::string pitId;
  nlohmann::json after;

  std::string encode() const;
  // Throws std::invalid_argument for text that is not a cursor.
  static PitCursor decode(const std::string &text);
};

// Request bodies and response parsing for the Elasticsearch REST API. Pure
// functions over JSON text, with no I/O.
class ElasticsearchCodec {
public:
  static nlohmann::json indexDefinition(const Schema &schema);

  // NDJSON _bulk body with one index action per record. Records with an
  // empty documentId let Elasticsearch generate the id.
  static std::string bulkBody(const std::string &index,
                              const std::vector<Record> &records);
  // Per-item outcome of a _bulk response with HTTP status 200.
  static WriteResult parseBulkResponse(const std::string &body,
                                       size_t attempted);
  // Failure applying to every record when the whole request was refused.
  static WriteResult wholeBatchFailure(int httpStatus, const std::string &body,
                                       size_t attempted);
  static RecordFailureKind classifyItemError(const std::string &type,
                                             const std::string &reason,
                                             int status);

  // Top-level properties of GET <index>/_mapping. Fields with sub-properties
  // and no explicit type are reported as "object".
  static Schema schemaFromMapping(const std::string &index,
                                  const std::string &body);

  static nlohmann::json searchRequest(const PitCursor &cursor,
                                      size_t pageSize,
                                      const std::string &keepAlive);
  static SearchPage parseSearchPage(const std::string &body);

  // Index names from _cat/indices?format=json, hidden indices excluded,
  // sorted.
  static std::vector<std::string> parseIndexList(const std::string &body);
  static uint64_t parseCount(const std::string &body);
  // "type: reason" from an error response, or the raw body cut to 200
  // characters.
  static std::string errorSummary(const std::string &body);
};

#endif
