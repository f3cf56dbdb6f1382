#include "engines/elasticsearch_codec.h"
#include "sync/TypeMapper.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

std::string PitCursor::encode() const {
  return json{{"pit", pitId}, {"after", after}}.dump();
}

PitCursor PitCursor::decode(const std::string &text) {
  json parsed;
  try {
    parsed = json::parse(text);
  } catch (const json::parse_error &e) {
    throw std::invalid_argument(std::string("malformed cursor: ") + e.what());
  }
  if (!parsed.is_object() || !parsed.contains("pit") ||
      !parsed["pit"].is_string())
    throw std::invalid_argument("cursor has no point in time id");
  PitCursor cursor;
  cursor.pitId = parsed["pit"].get<std::string>();
  cursor.after = parsed.value("after", json());
  return cursor;
}

// JSON columns are stored unindexed: their values may be scalars, arrays or
// objects, and only an unparsed object field accepts all three.
json ElasticsearchCodec::indexDefinition(const Schema &schema) {
  json properties = json::object();
  for (const auto &column : schema.columns) {
    json field = {{"type", column.nativeType}};
    if (column.nativeType == "object")
      field["enabled"] = false;
    properties[column.name] = std::move(field);
  }
  return {{"mappings", {{"properties", std::move(properties)}}}};
}

std::string ElasticsearchCodec::bulkBody(const std::string &index,
                                         const std::vector<Record> &records) {
  std::string body;
  for (const auto &record : records) {
    json action = {{"_index", index}};
    if (!record.documentId.empty())
      action["_id"] = record.documentId;
    body += json{{"index", std::move(action)}}.dump();
    body += '\n';

    json document = json::object();
    for (const auto &field : record.fields) {
      if (field.first == TypeMapper::DOCUMENT_ID_FIELD)
        continue;
      document[field.first] = fieldValueToJson(field.second);
    }
    body += document.dump(-1, ' ', false, json::error_handler_t::replace);
    body += '\n';
  }
  return body;
}

RecordFailureKind ElasticsearchCodec::classifyItemError(
    const std::string &type, const std::string &reason, int status) {
  std::string loweredReason = StringUtils::toLower(reason);
  if (status == 429 || type == "es_rejected_execution_exception" ||
      type == "circuit_breaking_exception")
    return RecordFailureKind::Rejected;
  if (type == "max_bytes_length_exceeded_exception" ||
      loweredReason.find("immense term") != std::string::npos ||
      loweredReason.find("too large") != std::string::npos)
    return RecordFailureKind::SizeLimit;
  if (type == "version_conflict_engine_exception")
    return RecordFailureKind::ConstraintViolation;
  if (type == "mapper_parsing_exception" ||
      type == "document_parsing_exception" ||
      type == "strict_dynamic_mapping_exception" ||
      (type == "illegal_argument_exception" &&
       loweredReason.find("failed to parse") != std::string::npos))
    return RecordFailureKind::TypeMismatch;
  return RecordFailureKind::Unknown;
}

WriteResult ElasticsearchCodec::parseBulkResponse(const std::string &body,
                                                  size_t attempted) {
  WriteResult result;
  result.attempted = attempted;

  json parsed;
  try {
    parsed = json::parse(body);
  } catch (const json::parse_error &e) {
    throw std::invalid_argument(std::string("unreadable bulk response: ") +
                                e.what());
  }
  if (!parsed.value("errors", false))
    return result;

  const json &items = parsed.value("items", json::array());
  for (size_t i = 0; i < items.size() && i < attempted; ++i) {
    const json &item = items[i];
    if (!item.is_object() || item.empty())
      continue;
    const json &outcome = item.begin().value();
    int status = outcome.value("status", 0);
    if (status < 300 && !outcome.contains("error"))
      continue;

    const json &error = outcome.value("error", json::object());
    std::string type = error.is_object() ? error.value("type", "") : "";
    std::string reason =
        error.is_object() ? error.value("reason", "") : error.dump();
    if (error.is_object() && error.contains("caused_by") &&
        error["caused_by"].is_object()) {
      reason += " (" + error["caused_by"].value("reason", "") + ")";
    }
    result.failures.push_back({i, classifyItemError(type, reason, status),
                               type.empty() ? reason : type + ": " + reason});
  }
  return result;
}

WriteResult ElasticsearchCodec::wholeBatchFailure(int httpStatus,
                                                  const std::string &body,
                                                  size_t attempted) {
  RecordFailureKind kind = RecordFailureKind::Unknown;
  if (httpStatus == 413)
    kind = RecordFailureKind::SizeLimit;
  else if (httpStatus == 429)
    kind = RecordFailureKind::Rejected;

  WriteResult result;
  result.attempted = attempted;
  std::string message =
      "bulk request refused with HTTP " + std::to_string(httpStatus) + ": " +
      errorSummary(body);
  for (size_t i = 0; i < attempted; ++i)
    result.failures.push_back({i, kind, message});
  return result;
}

Schema ElasticsearchCodec::schemaFromMapping(const std::string &index,
                                             const std::string &body) {
  json parsed = json::parse(body);
  Schema schema;
  schema.unitName = index;
  if (!parsed.is_object() || parsed.empty())
    return schema;

  // Keyed by the concrete index name, which differs from the request when
  // it went through an alias.
  const json &entry =
      parsed.contains(index) ? parsed[index] : parsed.begin().value();
  const json &mappings = entry.value("mappings", json::object());
  const json &properties = mappings.value("properties", json::object());
  for (auto it = properties.begin(); it != properties.end(); ++it) {
    Column column;
    column.name = it.key();
    if (it.value().contains("type") && it.value()["type"].is_string())
      column.nativeType = it.value()["type"].get<std::string>();
    else
      column.nativeType = "object";
    schema.columns.push_back(std::move(column));
  }
  return schema;
}

json ElasticsearchCodec::searchRequest(const PitCursor &cursor,
                                       size_t pageSize,
                                       const std::string &keepAlive) {
  json request = {
      {"size", pageSize},
      {"pit", {{"id", cursor.pitId}, {"keep_alive", keepAlive}}},
      {"sort", json::array({{{"_shard_doc", "asc"}}})},
      {"track_total_hits", false}};
  if (!cursor.after.is_null())
    request["search_after"] = cursor.after;
  return request;
}

SearchPage ElasticsearchCodec::parseSearchPage(const std::string &body) {
  json parsed = json::parse(body);
  SearchPage page;
  page.pitId = parsed.value("pit_id", "");

  const json &hits = parsed.value("hits", json::object());
  const json &list = hits.value("hits", json::array());
  page.records.reserve(list.size());
  for (const auto &hit : list) {
    Record record;
    record.documentId = hit.value("_id", "");
    const json &source = hit.value("_source", json::object());
    if (source.is_object()) {
      record.fields.reserve(source.size());
      for (auto it = source.begin(); it != source.end(); ++it)
        record.fields.emplace_back(it.key(), fieldValueFromJson(it.value()));
    }
    if (hit.contains("sort"))
      page.lastSort = hit["sort"];
    page.records.push_back(std::move(record));
  }
  return page;
}

std::vector<std::string>
ElasticsearchCodec::parseIndexList(const std::string &body) {
  std::vector<std::string> names;
  json parsed = json::parse(body);
  if (!parsed.is_array())
    return names;
  for (const auto &row : parsed) {
    std::string name = row.value("index", "");
    if (name.empty() || name.front() == '.')
      continue;
    names.push_back(std::move(name));
  }
  std::sort(names.begin(), names.end());
  return names;
}

uint64_t ElasticsearchCodec::parseCount(const std::string &body) {
  json parsed = json::parse(body);
  if (!parsed.contains("count") || !parsed["count"].is_number())
    throw std::invalid_argument("count response without a count");
  return parsed["count"].get<uint64_t>();
}

std::string ElasticsearchCodec::errorSummary(const std::string &body) {
  json parsed = json::parse(body, nullptr, false);
  if (parsed.is_object() && parsed.contains("error")) {
    const json &error = parsed["error"];
    if (error.is_object()) {
      std::string type = error.value("type", "");
      std::string reason = error.value("reason", "");
      if (!type.empty() || !reason.empty())
        return type + ": " + reason;
    } else if (error.is_string()) {
      return error.get<std::string>();
    }
  }
  return body.size() > 200 ? body.substr(0, 200) : body;
}
