#ifndef PROGRESS_AGGREGATOR_H
#define PROGRESS_AGGREGATOR_H

#include "sync/TaskStateMachine.h"
#include "sync/UnitRuntime.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct UnitProgress {
  std::string source;
  std::string target;
  UnitStatus status = UnitStatus::Pending;
  uint64_t totalRecords = 0;
  uint64_t processedRecords = 0;
  uint64_t failedRecords = 0;
  double percentage = 0.0;
  std::string errorMessage;

  nlohmann::json toJson() const;
};

struct TaskProgress {
  TaskStatus status = TaskStatus::Idle;
  uint64_t totalRecords = 0;
  uint64_t processedRecords = 0;
  double percentage = 0.0;
  // records per second since start
  double speed = 0.0;
  std::optional<double> estimatedSecondsRemaining;
  std::string startTime;
  std::vector<std::string> currentUnits;
  std::map<std::string, size_t> unitsByStatus;
  size_t errorCount = 0;
  std::vector<UnitProgress> units;

  nlohmann::json toJson() const;
};

// Derives TaskProgress from unit snapshots. Holds only the run's start
// instants, so recomputing is always safe and never double counts. Observers
// may compute while a restart marks a new start; mutex_ guards the instants.
class ProgressAggregator {
  mutable std::mutex mutex_;
  std::chrono::steady_clock::time_point started_;
  std::string startTime_;
  bool running_ = false;

public:
  // Called once per start; resume keeps the original instant so speed
  // covers paused time too.
  void markStarted();
  bool started() const;

  TaskProgress compute(TaskStatus status,
                       const std::vector<UnitRuntime> &units,
                       size_t errorCount) const;
  TaskProgress compute(TaskStatus status,
                       const std::vector<UnitRuntime> &units,
                       size_t errorCount,
                       std::chrono::steady_clock::time_point now) const;

  static UnitProgress unitProgress(const UnitRuntime &runtime);
};

#endif
