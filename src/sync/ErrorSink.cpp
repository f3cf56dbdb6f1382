#include "sync/ErrorSink.h"
#include "core/logger.h"
#include "utils/time_utils.h"

nlohmann::json ErrorLogEntry::toJson() const {
  return {{"timestamp", timestamp}, {"errorKind", errorKindToString(kind)},
          {"severity", severity},   {"unit", unit},
          {"message", message},     {"context", context}};
}

ErrorSink::ErrorSink(std::string taskId, ErrorStrategy strategy,
                     EventChannel *events)
    : taskId_(std::move(taskId)), strategy_(strategy), events_(events) {}

// Keeps the newest MAX_RETAINED_ENTRIES entries in memory. Every entry is
// still counted and published; the event channel applies its own cap.
void ErrorSink::append(ErrorLogEntry entry) {
  if (events_) {
    SyncEvent event;
    event.kind = SyncEventKind::ErrorLog;
    event.taskId = taskId_;
    event.unit = entry.unit;
    event.payload = entry.toJson();
    events_->publish(std::move(event));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (entry.severity == "error")
    errorCount_++;
  if (entries_.size() >= MAX_RETAINED_ENTRIES) {
    entries_.pop_front();
    droppedEntries_++;
  }
  entries_.push_back(std::move(entry));
}

ErrorVerdict ErrorSink::recordFailure(const std::string &unit,
                                      const RecordFailure &failure,
                                      nlohmann::json context) {
  ErrorLogEntry entry;
  entry.timestamp = TimeUtils::getCurrentTimestamp();
  entry.kind = ErrorKind::Data;
  entry.severity = "error";
  entry.unit = unit;
  entry.message = failure.message;
  entry.context = std::move(context);
  entry.context["failureKind"] = recordFailureKindToString(failure.kind);
  entry.context["recordIndex"] = failure.index;

  Logger::warning(LogCategory::TRANSFER, "ErrorSink",
                  unit + ": record " + std::to_string(failure.index) +
                      " failed (" + recordFailureKindToString(failure.kind) +
                      "): " + failure.message);
  append(std::move(entry));

  if (strategy_ == ErrorStrategy::Pause) {
    haltRequested_.store(true, std::memory_order_release);
    return ErrorVerdict::Halt;
  }
  return ErrorVerdict::Continue;
}

ErrorVerdict ErrorSink::recordFatal(const SyncError &error) {
  ErrorLogEntry entry;
  entry.timestamp = TimeUtils::getCurrentTimestamp();
  entry.kind = error.kind();
  entry.severity = "error";
  entry.unit = error.unit();
  entry.message = error.what();
  entry.context = nlohmann::json::object();
  if (!error.operation().empty())
    entry.context["operation"] = error.operation();

  Logger::error(LogCategory::TRANSFER, "ErrorSink", error.describe());
  append(std::move(entry));

  switch (error.kind()) {
  case ErrorKind::Schema:
  case ErrorKind::Provision:
    return ErrorVerdict::Continue;
  case ErrorKind::Data:
    if (strategy_ == ErrorStrategy::Skip)
      return ErrorVerdict::Continue;
    break;
  case ErrorKind::Connection:
  case ErrorKind::System:
    break;
  }
  haltRequested_.store(true, std::memory_order_release);
  return ErrorVerdict::Halt;
}

void ErrorSink::recordWarning(const std::string &unit,
                              const std::string &message,
                              nlohmann::json context) {
  ErrorLogEntry entry;
  entry.timestamp = TimeUtils::getCurrentTimestamp();
  entry.kind = ErrorKind::Schema;
  entry.severity = "warning";
  entry.unit = unit;
  entry.message = message;
  entry.context = std::move(context);

  Logger::warning(LogCategory::SCHEMA, "ErrorSink", unit + ": " + message);
  append(std::move(entry));
}

std::vector<ErrorLogEntry> ErrorSink::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<ErrorLogEntry>(entries_.begin(), entries_.end());
}

size_t ErrorSink::errorCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return errorCount_;
}

size_t ErrorSink::droppedEntries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return droppedEntries_;
}

void ErrorSink::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  errorCount_ = 0;
  droppedEntries_ = 0;
  haltRequested_.store(false, std::memory_order_release);
}
