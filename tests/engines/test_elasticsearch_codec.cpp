#include "engines/elasticsearch_codec.h"
#include "test_runner.h"
#include <sstream>

using json = nlohmann::json;

namespace {

std::vector<std::string> lines(const std::string &body) {
  std::vector<std::string> out;
  std::istringstream in(body);
  std::string line;
  while (std::getline(in, line))
    out.push_back(line);
  return out;
}

} // namespace

int main() {
  TestRunner runner;
  runner.printHeader("ELASTICSEARCH CODEC");

  runner.runTest("Bulk body pairs an action with each document", [&]() {
    Record withId;
    withId.documentId = "17";
    withId.set("_id", FieldValue::string("17"));
    withId.set("name", FieldValue::string("alpha"));
    Record generated;
    generated.set("name", FieldValue::null());

    std::string body =
        ElasticsearchCodec::bulkBody("shop_orders", {withId, generated});
    std::vector<std::string> rows = lines(body);
    runner.assertEquals(4, rows.size(), "Two action/document pairs");
    runner.assertTrue(body.back() == '\n', "Trailing newline");

    json action = json::parse(rows[0]);
    runner.assertEquals("17", action["index"]["_id"].get<std::string>(),
                        "Explicit id");
    runner.assertFalse(json::parse(rows[1]).contains("_id"),
                       "Id not repeated in the source");
    runner.assertFalse(json::parse(rows[2])["index"].contains("_id"),
                       "Generated id");
    runner.assertTrue(json::parse(rows[3])["name"].is_null(), "Null kept");
  });

  runner.runTest("Bulk response without errors", [&]() {
    WriteResult result = ElasticsearchCodec::parseBulkResponse(
        R"({"took":3,"errors":false,"items":[]})", 500);
    runner.assertTrue(result.ok(), "All applied");
    runner.assertEquals(500, result.succeeded(), "Succeeded count");
  });

  runner.runTest("Bulk response item failures are classified", [&]() {
    std::string body = R"({"errors":true,"items":[
      {"index":{"status":201}},
      {"index":{"status":400,"error":{"type":"mapper_parsing_exception",
        "reason":"failed to parse field [age]",
        "caused_by":{"reason":"For input string: \"x\""}}}},
      {"index":{"status":429,"error":{"type":"es_rejected_execution_exception",
        "reason":"queue full"}}},
      {"index":{"status":409,"error":{
        "type":"version_conflict_engine_exception","reason":"conflict"}}}
    ]})";
    WriteResult result = ElasticsearchCodec::parseBulkResponse(body, 4);
    runner.assertEquals(3, result.failures.size(), "Three failures");
    runner.assertEquals(1, result.failures[0].index, "Index of the first");
    runner.assertTrue(result.failures[0].kind == RecordFailureKind::TypeMismatch,
                      "Mapping error");
    runner.assertTrue(result.failures[0].message.find("For input string") !=
                          std::string::npos,
                      "Cause included");
    runner.assertTrue(result.failures[1].kind == RecordFailureKind::Rejected,
                      "Back-pressure");
    runner.assertTrue(result.failures[2].kind ==
                          RecordFailureKind::ConstraintViolation,
                      "Version conflict");
    runner.assertThrows<std::invalid_argument>(
        [&]() { ElasticsearchCodec::parseBulkResponse("<html>", 1); },
        "Unreadable response");
  });

  runner.runTest("Item error classification", [&]() {
    runner.assertTrue(ElasticsearchCodec::classifyItemError(
                          "illegal_argument_exception",
                          "Document contains at least one immense term", 400) ==
                          RecordFailureKind::SizeLimit,
                      "Immense term");
    runner.assertTrue(ElasticsearchCodec::classifyItemError(
                          "illegal_argument_exception", "Failed to parse value",
                          400) == RecordFailureKind::TypeMismatch,
                      "Parse failure");
    runner.assertTrue(ElasticsearchCodec::classifyItemError("", "", 429) ==
                          RecordFailureKind::Rejected,
                      "Status 429");
    runner.assertTrue(ElasticsearchCodec::classifyItemError(
                          "some_new_exception", "odd", 500) ==
                          RecordFailureKind::Unknown,
                      "Unknown");
  });

  runner.runTest("Whole batch refusal fails every record", [&]() {
    WriteResult tooLarge = ElasticsearchCodec::wholeBatchFailure(
        413, R"({"error":{"type":"content_too_long","reason":"big"}})", 3);
    runner.assertEquals(3, tooLarge.failures.size(), "Every record");
    runner.assertTrue(tooLarge.failures[2].kind == RecordFailureKind::SizeLimit,
                      "413 is a size limit");
    runner.assertTrue(tooLarge.failures[0].message.find("content_too_long") !=
                          std::string::npos,
                      "Summary in the message");
    WriteResult busy = ElasticsearchCodec::wholeBatchFailure(429, "", 2);
    runner.assertTrue(busy.failures[0].kind == RecordFailureKind::Rejected,
                      "429 is back-pressure");
  });

  runner.runTest("Schema from mapping", [&]() {
    std::string body = R"({"logs-2024.05":{"mappings":{"properties":{
      "message":{"type":"text"},
      "status":{"type":"keyword"},
      "host":{"properties":{"name":{"type":"keyword"}}}}}}})";
    Schema schema = ElasticsearchCodec::schemaFromMapping("logs", body);
    runner.assertEquals("logs", schema.unitName, "Requested name kept");
    runner.assertEquals(3, schema.columns.size(), "Three fields");
    runner.assertEquals("object", schema.findColumn("host")->nativeType,
                        "Nested properties are objects");
    runner.assertEquals("keyword", schema.findColumn("status")->nativeType,
                        "Explicit type");
  });

  runner.runTest("Index definition disables parsing of objects", [&]() {
    Schema schema;
    schema.columns.push_back({"id", "long", false, true});
    schema.columns.push_back({"payload", "object", true, false});
    json definition = ElasticsearchCodec::indexDefinition(schema);
    const json &props = definition["mappings"]["properties"];
    runner.assertEquals("long", props["id"]["type"].get<std::string>(), "Type");
    runner.assertFalse(props["payload"]["enabled"].get<bool>(),
                       "Object not indexed");
  });

  runner.runTest("Search requests follow the point in time", [&]() {
    PitCursor first{"pit-1", json()};
    json request = ElasticsearchCodec::searchRequest(first, 1000, "30m");
    runner.assertEquals(1000, request["size"].get<int>(), "Page size");
    runner.assertEquals("pit-1", request["pit"]["id"].get<std::string>(),
                        "PIT id");
    runner.assertFalse(request.contains("search_after"), "First page");

    PitCursor later{"pit-2", json::array({42})};
    request = ElasticsearchCodec::searchRequest(later, 10, "30m");
    runner.assertEquals("[42]", request["search_after"].dump(), "Resume point");
  });

  runner.runTest("Search page parsing", [&]() {
    std::string body = R"({"pit_id":"pit-3","hits":{"hits":[
      {"_id":"a","_source":{"n":1},"sort":[1]},
      {"_id":"b","_source":{"n":2,"tags":["x"]},"sort":[2]}]}})";
    SearchPage page = ElasticsearchCodec::parseSearchPage(body);
    runner.assertEquals("pit-3", page.pitId, "Latest PIT id");
    runner.assertEquals(2, page.records.size(), "Two hits");
    runner.assertEquals("b", page.records[1].documentId, "Document id");
    runner.assertEquals("[2]", page.lastSort.dump(), "Last sort values");
    runner.assertTrue(page.records[1].get("tags")->kind() == FieldKind::Object,
                      "Array field");
  });

  runner.runTest("Cursor encoding", [&]() {
    PitCursor cursor{"abc", json::array({7, "x"})};
    PitCursor decoded = PitCursor::decode(cursor.encode());
    runner.assertEquals("abc", decoded.pitId, "PIT id");
    runner.assertEquals(cursor.after.dump(), decoded.after.dump(), "After");
    runner.assertThrows<std::invalid_argument>(
        [&]() { PitCursor::decode("12345"); }, "Keyset cursor is not a PIT");
    runner.assertThrows<std::invalid_argument>(
        [&]() { PitCursor::decode("{not json"); }, "Malformed");
  });

  runner.runTest("Index list, count and error summary", [&]() {
    std::vector<std::string> names = ElasticsearchCodec::parseIndexList(
        R"([{"index":"zeta"},{"index":".kibana"},{"index":"alpha"}])");
    runner.assertEquals(2, names.size(), "Hidden index dropped");
    runner.assertEquals("alpha", names[0], "Sorted");
    runner.assertEquals(12, ElasticsearchCodec::parseCount(
                                R"({"count":12,"_shards":{}})"),
                        "Count");
    runner.assertThrows<std::invalid_argument>(
        [&]() { ElasticsearchCodec::parseCount("{}"); }, "No count");
    runner.assertEquals(
        "index_not_found_exception: no such index",
        ElasticsearchCodec::errorSummary(
            R"({"error":{"type":"index_not_found_exception","reason":"no such index"},"status":404})"),
        "Type and reason");
    runner.assertEquals(200,
                        ElasticsearchCodec::errorSummary(std::string(500, 'x'))
                            .size(),
                        "Raw bodies are cut");
  });

  return runner.printSummary();
}
