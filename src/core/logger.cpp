#include "core/logger.h"
#include "core/console_log_writer.h"
#include "core/file_log_writer.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <cstdlib>
#include <iostream>
#include <unordered_map>

std::vector<std::unique_ptr<ILogWriter>> Logger::writers_;
std::mutex Logger::logMutex;

LogLevel Logger::currentLogLevel = LogLevel::INFO;
std::mutex Logger::configMutex;

namespace {

const std::unordered_map<std::string, LogLevel> LEVEL_NAMES = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

const char *levelName(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

const char *categoryName(LogCategory category) {
  switch (category) {
  case LogCategory::SYSTEM:
    return "SYSTEM";
  case LogCategory::DATABASE:
    return "DATABASE";
  case LogCategory::SEARCH:
    return "SEARCH";
  case LogCategory::TRANSFER:
    return "TRANSFER";
  case LogCategory::CONFIG:
    return "CONFIG";
  case LogCategory::SCHEMA:
    return "SCHEMA";
  case LogCategory::PROGRESS:
    return "PROGRESS";
  case LogCategory::UNKNOWN:
    break;
  }
  return "UNKNOWN";
}

} // namespace

// Formats the line once and hands it to every open sink. Messages below the
// configured level are dropped before any formatting work is done. Before
// initialize() has installed a sink, lines go straight to stderr so early
// configuration errors are never lost.
void Logger::writeLog(LogLevel level, LogCategory category,
                      const std::string &function,
                      const std::string &message) {
  {
    std::lock_guard<std::mutex> configLock(configMutex);
    if (level < currentLogLevel)
      return;
  }

  std::string line = "[" + TimeUtils::getCurrentTimestamp() + "] [" +
                     levelName(level) + "] [" + categoryName(category) + "]";
  if (!function.empty())
    line += " [" + function + "]";
  line += " " + message;

  std::lock_guard<std::mutex> lock(logMutex);
  if (writers_.empty()) {
    std::cerr << line << std::endl;
    return;
  }
  for (auto &writer : writers_) {
    if (writer->isOpen())
      writer->write(line);
  }
}

void Logger::initialize(const std::string &logFile) {
  {
    std::lock_guard<std::mutex> lock(logMutex);
    writers_.clear();
    writers_.push_back(std::make_unique<ConsoleLogWriter>());
    if (!logFile.empty()) {
      auto fileWriter = std::make_unique<FileLogWriter>(logFile);
      if (fileWriter->isOpen()) {
        writers_.push_back(std::move(fileWriter));
      } else {
        std::cerr << "Warning: could not open log file '" << logFile
                  << "', logging to stderr only" << std::endl;
      }
    }
  }

  if (const char *envLevel = std::getenv("DOCBRIDGE_LOG_LEVEL"))
    setLogLevel(std::string(envLevel));
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(logMutex);
  for (auto &writer : writers_) {
    writer->flush();
    writer->close();
  }
  writers_.clear();
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = level;
}

void Logger::setLogLevel(const std::string &levelStr) {
  auto it =
      LEVEL_NAMES.find(StringUtils::toUpper(StringUtils::trim(levelStr)));
  if (it == LEVEL_NAMES.end())
    return;
  setLogLevel(it->second);
}
