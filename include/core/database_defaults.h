#ifndef DATABASE_DEFAULTS_H
#define DATABASE_DEFAULTS_H

#include <cstddef>

namespace DatabaseDefaults {
constexpr int DEFAULT_MYSQL_PORT = 3306;
constexpr int DEFAULT_ELASTICSEARCH_PORT = 9200;
constexpr int MYSQL_TIMEOUT_SECONDS = 600;
constexpr int HTTP_TIMEOUT_SECONDS = 120;
constexpr int CONNECT_TIMEOUT_SECONDS = 10;

constexpr size_t MYSQL_DEFAULT_BATCH_SIZE = 1000;
constexpr size_t ELASTICSEARCH_DEFAULT_BATCH_SIZE = 500;

constexpr const char *ELASTICSEARCH_PIT_KEEP_ALIVE = "30m";
constexpr const char *DEFAULT_CHARSET = "utf8mb4";
constexpr const char *DEFAULT_COLLATION = "utf8mb4_unicode_ci";

constexpr size_t MAX_TABLE_NAME_LENGTH = 64;
constexpr size_t MAX_INDEX_NAME_LENGTH = 255;

// A batch slower than this counts towards resource pressure.
constexpr long SLOW_BATCH_MILLIS = 15000;
constexpr int PRESSURE_STREAK_TO_SHRINK = 3;
constexpr int HEALTHY_STREAK_TO_GROW = 10;

constexpr const char *SYSTEM_DATABASES[] = {
    "information_schema", "mysql", "performance_schema", "sys"};
constexpr size_t SYSTEM_DATABASE_COUNT = 4;
} // namespace DatabaseDefaults

#endif
