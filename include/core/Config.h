#ifndef CONFIG_H
#define CONFIG_H

#include "core/database_defaults.h"
#include "core/sync_config.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

enum class EndpointKind { MySQL, Elasticsearch };

std::string endpointKindToString(EndpointKind kind);
EndpointKind parseEndpointKind(const std::string &value);

struct EndpointConfig {
  EndpointKind kind = EndpointKind::MySQL;
  std::string host = "localhost";
  int port = 0;
  std::string user;
  std::string password;
  // MySQL: default schema for the session, and the destination database when
  // Elasticsearch indices are written into MySQL.
  std::string database;
  // Elasticsearch only.
  std::string scheme = "http";
  bool verifyTls = true;

  int resolvedPort() const {
    if (port > 0)
      return port;
    return kind == EndpointKind::MySQL
               ? DatabaseDefaults::DEFAULT_MYSQL_PORT
               : DatabaseDefaults::DEFAULT_ELASTICSEARCH_PORT;
  }

  std::string toSafeString() const;
};

enum class TransformMode { Prefix, Suffix };

// Replaces a leading (Prefix) or trailing (Suffix) sourcePattern with
// targetPattern. Names that do not carry sourcePattern pass through.
struct NameTransform {
  bool enabled = false;
  TransformMode mode = TransformMode::Prefix;
  std::string sourcePattern;
  std::string targetPattern;

  std::string apply(const std::string &name) const;
};

struct DatabaseSelection {
  std::string database;
  std::vector<std::string> tables;
};

struct TaskDefinition {
  std::string taskId;
  EndpointConfig source;
  EndpointConfig target;
  std::vector<DatabaseSelection> databases;
  std::vector<std::string> indexPatterns;
  NameTransform databaseNameTransform;
  NameTransform indexNameTransform;
  SyncConfig sync;
  std::string logFile;
};

class TaskConfigLoader {
public:
  // Reads and validates a task file. Throws std::invalid_argument for
  // malformed or out-of-range content and std::runtime_error when the file
  // cannot be read. Passwords are overridden by DOCBRIDGE_SOURCE_PASSWORD and
  // DOCBRIDGE_TARGET_PASSWORD when set.
  static TaskDefinition loadFromFile(const std::string &path);
  static TaskDefinition loadFromJson(const nlohmann::json &config);

  static void applyEnvironment(TaskDefinition &task);

private:
  static EndpointConfig parseEndpoint(const nlohmann::json &node,
                                      const std::string &role);
  static NameTransform parseTransform(const nlohmann::json &node);
  static SyncConfig parseSyncConfig(const nlohmann::json &node);
};

#endif
