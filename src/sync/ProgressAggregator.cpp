#include "sync/ProgressAggregator.h"
#include "utils/time_utils.h"
#include <algorithm>

nlohmann::json UnitProgress::toJson() const {
  nlohmann::json j;
  j["source"] = source;
  j["target"] = target;
  j["status"] = unitStatusToString(status);
  j["totalRecords"] = totalRecords;
  j["processedRecords"] = processedRecords;
  j["failedRecords"] = failedRecords;
  j["percentage"] = percentage;
  if (!errorMessage.empty())
    j["errorMessage"] = errorMessage;
  return j;
}

nlohmann::json TaskProgress::toJson() const {
  nlohmann::json j;
  j["status"] = taskStatusToString(status);
  j["totalRecords"] = totalRecords;
  j["processedRecords"] = processedRecords;
  j["percentage"] = percentage;
  j["speed"] = speed;
  if (estimatedSecondsRemaining)
    j["estimatedSecondsRemaining"] = *estimatedSecondsRemaining;
  else
    j["estimatedSecondsRemaining"] = nullptr;
  j["startTime"] = startTime;
  j["currentUnits"] = currentUnits;
  j["unitsByStatus"] = unitsByStatus;
  j["errorCount"] = errorCount;
  nlohmann::json unitList = nlohmann::json::array();
  for (const auto &unit : units)
    unitList.push_back(unit.toJson());
  j["units"] = std::move(unitList);
  return j;
}

void ProgressAggregator::markStarted() {
  std::string startTime =
      TimeUtils::toIso8601(std::chrono::system_clock::now());
  std::lock_guard<std::mutex> lock(mutex_);
  started_ = std::chrono::steady_clock::now();
  startTime_ = std::move(startTime);
  running_ = true;
}

bool ProgressAggregator::started() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

UnitProgress ProgressAggregator::unitProgress(const UnitRuntime &runtime) {
  UnitProgress unit;
  unit.source = runtime.unit.source;
  unit.target = runtime.unit.target;
  unit.status = runtime.status;
  unit.totalRecords = runtime.totalRecords;
  unit.processedRecords = runtime.processedRecords;
  unit.failedRecords = runtime.failedRecords;
  unit.percentage = runtime.percentage();
  unit.errorMessage = runtime.errorMessage;
  return unit;
}

TaskProgress
ProgressAggregator::compute(TaskStatus status,
                            const std::vector<UnitRuntime> &units,
                            size_t errorCount) const {
  return compute(status, units, errorCount, std::chrono::steady_clock::now());
}

/*
 * Task totals are plain sums over the unit snapshots. Percentage comes from
 * the sums rather than averaging unit percentages, so large units weigh in
 * proportionally. A completed unit counts as fully processed even when its
 * count estimate was higher than what the reader actually produced.
 *
 * Speed uses the monotonic clock from markStarted(); ETA stays unknown while
 * nothing has been processed.
 */
TaskProgress
ProgressAggregator::compute(TaskStatus status,
                            const std::vector<UnitRuntime> &units,
                            size_t errorCount,
                            std::chrono::steady_clock::time_point now) const {
  std::chrono::steady_clock::time_point started;
  bool running = false;
  TaskProgress progress;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    started = started_;
    running = running_;
    progress.startTime = startTime_;
  }
  progress.status = status;
  progress.errorCount = errorCount;

  for (const char *name :
       {"pending", "running", "paused", "completed", "failed"})
    progress.unitsByStatus[name] = 0;

  for (const auto &runtime : units) {
    UnitProgress unit = unitProgress(runtime);
    uint64_t total = std::max(unit.totalRecords, unit.processedRecords);
    if (unit.status == UnitStatus::Completed)
      total = unit.processedRecords;
    progress.totalRecords += total;
    progress.processedRecords += unit.processedRecords;
    progress.unitsByStatus[unitStatusToString(unit.status)]++;
    if (unit.status == UnitStatus::Running)
      progress.currentUnits.push_back(unit.target);
    progress.units.push_back(std::move(unit));
  }

  if (progress.totalRecords > 0) {
    progress.percentage =
        static_cast<double>(progress.processedRecords) * 100.0 /
        static_cast<double>(progress.totalRecords);
    progress.percentage = std::clamp(progress.percentage, 0.0, 100.0);
  } else if (status == TaskStatus::Completed) {
    progress.percentage = 100.0;
  }

  if (running) {
    double elapsed = std::chrono::duration<double>(now - started).count();
    if (elapsed > 0.0)
      progress.speed = static_cast<double>(progress.processedRecords) / elapsed;
  }
  if (progress.speed > 0.0) {
    uint64_t remaining = progress.totalRecords - progress.processedRecords;
    progress.estimatedSecondsRemaining =
        static_cast<double>(remaining) / progress.speed;
  }
  return progress;
}
