#ifndef ERROR_SINK_H
#define ERROR_SINK_H

#include "core/sync_config.h"
#include "core/sync_errors.h"
#include "engines/database_engine.h"
#include "sync/EventChannel.h"
#include <atomic>
#include <deque>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

enum class ErrorVerdict { Continue, Halt };

struct ErrorLogEntry {
  std::string timestamp;
  ErrorKind kind = ErrorKind::Data;
  // "warning" or "error"
  std::string severity;
  std::string unit;
  std::string message;
  nlohmann::json context;

  nlohmann::json toJson() const;
};

// Run-scoped error log for one task. Decides, per the configured strategy,
// whether the issuing unit may keep going.
class ErrorSink {
public:
  static constexpr size_t MAX_RETAINED_ENTRIES = 10000;

private:
  std::string taskId_;
  ErrorStrategy strategy_;
  EventChannel *events_;

  mutable std::mutex mutex_;
  std::deque<ErrorLogEntry> entries_;
  size_t errorCount_ = 0;
  size_t droppedEntries_ = 0;
  std::atomic<bool> haltRequested_{false};

  void append(ErrorLogEntry entry);

public:
  ErrorSink(std::string taskId, ErrorStrategy strategy, EventChannel *events);

  // Per-record write or conversion failure. Context should identify the
  // record (unit, batch, index, key), never carry the record body.
  ErrorVerdict recordFailure(const std::string &unit,
                             const RecordFailure &failure,
                             nlohmann::json context);

  // Unit or task level failure. Schema and provision errors only end their
  // unit; system and connection errors halt the task whatever the strategy.
  ErrorVerdict recordFatal(const SyncError &error);

  void recordWarning(const std::string &unit, const std::string &message,
                     nlohmann::json context = nlohmann::json::object());

  std::vector<ErrorLogEntry> entries() const;
  size_t errorCount() const;
  size_t droppedEntries() const;
  bool haltRequested() const {
    return haltRequested_.load(std::memory_order_acquire);
  }
  // Called on resume; the retained entries stay.
  void resetHalt() { haltRequested_.store(false, std::memory_order_release); }
  ErrorStrategy strategy() const { return strategy_; }
  void clear();
};

#endif
