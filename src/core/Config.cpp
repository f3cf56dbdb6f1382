#include "core/Config.h"
#include "core/logger.h"
#include "utils/connection_utils.h"
#include "utils/string_utils.h"
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace {
bool validateAndSetPort(const json &value, int &targetPort) {
  int portNum = 0;
  if (value.is_number_integer()) {
    portNum = value.get<int>();
  } else if (value.is_string()) {
    std::string portStr = value.get<std::string>();
    if (!StringUtils::isUnsignedInteger(portStr) || portStr.length() > 5)
      return false;
    portNum = std::stoi(portStr);
  } else {
    return false;
  }
  if (portNum > 0 && portNum <= 65535) {
    targetPort = portNum;
    return true;
  }
  return false;
}

std::string stringField(const json &node, const char *key,
                        const std::string &fallback = "") {
  if (!node.contains(key) || node[key].is_null())
    return fallback;
  if (!node[key].is_string())
    throw std::invalid_argument(std::string("'") + key + "' must be a string");
  return node[key].get<std::string>();
}

size_t sizeField(const json &node, const char *key, size_t fallback) {
  if (!node.contains(key) || node[key].is_null())
    return fallback;
  if (!node[key].is_number_integer() || node[key].get<long long>() < 0)
    throw std::invalid_argument(std::string("'") + key +
                                "' must be a non-negative integer");
  return node[key].get<size_t>();
}
} // namespace

std::string endpointKindToString(EndpointKind kind) {
  return kind == EndpointKind::MySQL ? "mysql" : "elasticsearch";
}

EndpointKind parseEndpointKind(const std::string &value) {
  std::string lower = StringUtils::toLower(StringUtils::trim(value));
  if (lower == "mysql" || lower == "mariadb")
    return EndpointKind::MySQL;
  if (lower == "elasticsearch" || lower == "es")
    return EndpointKind::Elasticsearch;
  throw std::invalid_argument("unsupported endpoint kind '" + value +
                              "' (expected mysql or elasticsearch)");
}

std::string EndpointConfig::toSafeString() const {
  std::string text = endpointKindToString(kind) + "://";
  if (!user.empty())
    text += user + ":***@";
  text += host + ":" + std::to_string(resolvedPort());
  if (!database.empty())
    text += "/" + database;
  return text;
}

std::string NameTransform::apply(const std::string &name) const {
  if (!enabled || sourcePattern.empty())
    return name;
  if (mode == TransformMode::Prefix) {
    if (StringUtils::startsWith(name, sourcePattern))
      return targetPattern + name.substr(sourcePattern.size());
    return name;
  }
  if (StringUtils::endsWith(name, sourcePattern))
    return name.substr(0, name.size() - sourcePattern.size()) + targetPattern;
  return name;
}

// Reads the task file and hands the parsed document to loadFromJson. Unlike
// the rest of the configuration layer there is no silent fallback here: a
// task that cannot be read must never start with guessed settings.
TaskDefinition TaskConfigLoader::loadFromFile(const std::string &path) {
  std::ifstream configFile(path);
  if (!configFile.is_open()) {
    throw std::runtime_error("Could not open task file '" + path + "'");
  }

  json config;
  try {
    configFile >> config;
  } catch (const json::parse_error &e) {
    throw std::invalid_argument("Task file '" + path +
                                "' is not valid JSON: " + e.what());
  }

  TaskDefinition task = loadFromJson(config);
  applyEnvironment(task);
  Logger::info(LogCategory::CONFIG, "TaskConfigLoader",
               "Loaded task '" + task.taskId + "' from " + path + " (" +
                   task.source.toSafeString() + " -> " +
                   task.target.toSafeString() + ")");
  return task;
}

TaskDefinition TaskConfigLoader::loadFromJson(const json &config) {
  if (!config.is_object())
    throw std::invalid_argument("task configuration must be a JSON object");

  TaskDefinition task;
  task.taskId = stringField(config, "taskId");
  if (task.taskId.empty())
    throw std::invalid_argument("'taskId' is required");

  if (!config.contains("source") || !config.contains("target"))
    throw std::invalid_argument("'source' and 'target' endpoints are required");
  task.source = parseEndpoint(config["source"], "source");
  task.target = parseEndpoint(config["target"], "target");
  if (task.source.kind == task.target.kind)
    throw std::invalid_argument(
        "source and target must be different kinds (mysql <-> elasticsearch)");

  if (config.contains("databases")) {
    if (!config["databases"].is_array())
      throw std::invalid_argument("'databases' must be an array");
    for (const auto &entry : config["databases"]) {
      DatabaseSelection selection;
      selection.database = stringField(entry, "database");
      if (selection.database.empty())
        throw std::invalid_argument("database selection without 'database'");
      if (entry.contains("tables")) {
        for (const auto &table : entry["tables"]) {
          if (!table.is_string())
            throw std::invalid_argument("table names must be strings");
          selection.tables.push_back(table.get<std::string>());
        }
      }
      task.databases.push_back(std::move(selection));
    }
  }

  if (config.contains("indices")) {
    if (!config["indices"].is_array())
      throw std::invalid_argument("'indices' must be an array");
    for (const auto &entry : config["indices"]) {
      std::string pattern =
          entry.is_string() ? entry.get<std::string>()
                            : stringField(entry, "pattern");
      if (pattern.empty())
        throw std::invalid_argument("index selection without 'pattern'");
      task.indexPatterns.push_back(pattern);
    }
  }

  if (task.source.kind == EndpointKind::MySQL && task.databases.empty())
    throw std::invalid_argument("a mysql source needs at least one entry in "
                                "'databases'");
  if (task.source.kind == EndpointKind::Elasticsearch &&
      task.indexPatterns.empty())
    throw std::invalid_argument(
        "an elasticsearch source needs at least one entry in 'indices'");
  if (task.target.kind == EndpointKind::MySQL && task.target.database.empty())
    throw std::invalid_argument(
        "a mysql target needs 'database' to receive the indices");

  if (config.contains("dbNameTransform"))
    task.databaseNameTransform = parseTransform(config["dbNameTransform"]);
  if (config.contains("indexNameTransform"))
    task.indexNameTransform = parseTransform(config["indexNameTransform"]);

  if (config.contains("sync"))
    task.sync = parseSyncConfig(config["sync"]);

  task.logFile = stringField(config, "logFile");
  return task;
}

void TaskConfigLoader::applyEnvironment(TaskDefinition &task) {
  if (const char *pw = std::getenv("DOCBRIDGE_SOURCE_PASSWORD"))
    task.source.password = pw;
  if (const char *pw = std::getenv("DOCBRIDGE_TARGET_PASSWORD"))
    task.target.password = pw;
}

EndpointConfig TaskConfigLoader::parseEndpoint(const json &node,
                                               const std::string &role) {
  if (!node.is_object())
    throw std::invalid_argument("'" + role + "' must be an object");

  EndpointConfig endpoint;
  endpoint.kind = parseEndpointKind(stringField(node, "kind"));

  std::string connectionString = stringField(node, "connectionString");
  if (!connectionString.empty()) {
    auto params = ConnectionStringParser::parse(connectionString);
    if (!params)
      throw std::invalid_argument("invalid connectionString for " + role);
    endpoint.host = params->host;
    endpoint.user = params->user;
    endpoint.password = params->password;
    endpoint.database = params->db;
    if (!params->port.empty())
      endpoint.port = std::stoi(params->port);
    if (!params->scheme.empty())
      endpoint.scheme = params->scheme;
  }

  endpoint.host = stringField(node, "host", endpoint.host);
  endpoint.user = stringField(node, "user", endpoint.user);
  endpoint.password = stringField(node, "password", endpoint.password);
  endpoint.database = stringField(node, "database", endpoint.database);
  endpoint.scheme =
      StringUtils::toLower(stringField(node, "scheme", endpoint.scheme));

  if (node.contains("port") && !node["port"].is_null() &&
      !validateAndSetPort(node["port"], endpoint.port))
    throw std::invalid_argument(role + " port must be between 1 and 65535");

  if (node.contains("verifyTls")) {
    if (!node["verifyTls"].is_boolean())
      throw std::invalid_argument("'verifyTls' must be a boolean");
    endpoint.verifyTls = node["verifyTls"].get<bool>();
  }

  if (endpoint.host.empty())
    throw std::invalid_argument(role + " host is required");
  if (endpoint.scheme != "http" && endpoint.scheme != "https")
    throw std::invalid_argument(role + " scheme must be http or https");
  if (endpoint.kind == EndpointKind::MySQL && !endpoint.database.empty() &&
      !StringUtils::isValidTableName(endpoint.database))
    throw std::invalid_argument(role + " database name '" + endpoint.database +
                                "' is not a valid identifier");
  return endpoint;
}

NameTransform TaskConfigLoader::parseTransform(const json &node) {
  NameTransform transform;
  if (node.is_null())
    return transform;
  if (!node.is_object())
    throw std::invalid_argument("name transform must be an object");

  transform.enabled = node.value("enabled", false);
  std::string mode = StringUtils::toLower(stringField(node, "mode", "prefix"));
  if (mode == "prefix")
    transform.mode = TransformMode::Prefix;
  else if (mode == "suffix")
    transform.mode = TransformMode::Suffix;
  else
    throw std::invalid_argument("name transform mode must be prefix or suffix");
  transform.sourcePattern = stringField(node, "sourcePattern");
  transform.targetPattern = stringField(node, "targetPattern");
  return transform;
}

SyncConfig TaskConfigLoader::parseSyncConfig(const json &node) {
  if (!node.is_object())
    throw std::invalid_argument("'sync' must be an object");

  SyncConfig sync;
  sync.setThreadCount(
      sizeField(node, "threadCount", SyncConfig::DEFAULT_THREAD_COUNT));
  sync.setBatchSize(
      sizeField(node, "batchSize", SyncConfig::DEFAULT_BATCH_SIZE));
  sync.setReadPageSize(
      sizeField(node, "readPageSize", SyncConfig::DEFAULT_READ_PAGE_SIZE));
  sync.setProgressIntervalMs(sizeField(
      node, "progressIntervalMs", SyncConfig::DEFAULT_PROGRESS_INTERVAL_MS));
  sync.setErrorStrategy(
      parseErrorStrategy(stringField(node, "errorStrategy", "skip")));
  sync.setUnitExistsStrategy(
      parseUnitExistsStrategy(stringField(node, "unitExistsStrategy", "drop")));
  return sync;
}
