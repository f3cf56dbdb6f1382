#ifndef LOGGER_H
#define LOGGER_H

#include "core/log_writer.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
  CRITICAL = 4
};

enum class LogCategory {
  SYSTEM = 0,
  DATABASE = 1,
  SEARCH = 2,
  TRANSFER = 3,
  CONFIG = 4,
  SCHEMA = 5,
  PROGRESS = 6,
  UNKNOWN = 99
};

// Process-wide logger shared by every task and worker thread. Lines look like
// "[2024-05-01 12:30:00.250] [INFO] [TRANSFER] [PipelineCoordinator] text".
class Logger {
private:
  static std::vector<std::unique_ptr<ILogWriter>> writers_;
  static std::mutex logMutex;

  static LogLevel currentLogLevel;
  static std::mutex configMutex;

  static void writeLog(LogLevel level, LogCategory category,
                       const std::string &function,
                       const std::string &message);

public:
  // Installs the stderr sink, plus a rotating file sink when logFile is not
  // empty, and applies DOCBRIDGE_LOG_LEVEL if it is set.
  static void initialize(const std::string &logFile = "");
  static void shutdown();

  static void debug(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::DEBUG, category, function, message);
  }

  static void info(LogCategory category, const std::string &function,
                   const std::string &message) {
    writeLog(LogLevel::INFO, category, function, message);
  }

  static void warning(LogCategory category, const std::string &function,
                      const std::string &message) {
    writeLog(LogLevel::WARNING, category, function, message);
  }

  static void error(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::ERROR, category, function, message);
  }

  static void critical(LogCategory category, const std::string &function,
                       const std::string &message) {
    writeLog(LogLevel::CRITICAL, category, function, message);
  }

  static void setLogLevel(LogLevel level);
  // Accepts DEBUG, INFO, WARN/WARNING, ERROR, FATAL/CRITICAL in any case.
  // Anything else leaves the current level untouched.
  static void setLogLevel(const std::string &levelStr);
};

#endif
