#ifndef SYNC_CONFIG_H
#define SYNC_CONFIG_H

#include <cstddef>
#include <stdexcept>
#include <string>

enum class ErrorStrategy { Skip, Pause };

enum class UnitExistsStrategy { Drop, Truncate, Backup };

std::string errorStrategyToString(ErrorStrategy strategy);
ErrorStrategy parseErrorStrategy(const std::string &value);
std::string unitExistsStrategyToString(UnitExistsStrategy strategy);
UnitExistsStrategy parseUnitExistsStrategy(const std::string &value);

// Per-task tuning. Immutable once a run starts: the engine copies it into
// every worker.
class SyncConfig {
public:
  static constexpr size_t DEFAULT_THREAD_COUNT = 4;
  static constexpr size_t DEFAULT_BATCH_SIZE = 0;
  static constexpr size_t DEFAULT_READ_PAGE_SIZE = 1000;
  static constexpr size_t DEFAULT_PROGRESS_INTERVAL_MS = 1000;

  static constexpr size_t MIN_THREAD_COUNT = 1;
  static constexpr size_t MAX_THREAD_COUNT = 32;
  static constexpr size_t MIN_BATCH_SIZE = 1;
  static constexpr size_t MAX_BATCH_SIZE = 100000;
  static constexpr size_t MIN_READ_PAGE_SIZE = 1;
  static constexpr size_t MAX_READ_PAGE_SIZE = 100000;
  static constexpr size_t MIN_PROGRESS_INTERVAL_MS = 1000;
  static constexpr size_t MAX_PROGRESS_INTERVAL_MS = 60000;

private:
  size_t threadCount_ = DEFAULT_THREAD_COUNT;
  size_t batchSize_ = DEFAULT_BATCH_SIZE;
  size_t readPageSize_ = DEFAULT_READ_PAGE_SIZE;
  size_t progressIntervalMs_ = DEFAULT_PROGRESS_INTERVAL_MS;
  ErrorStrategy errorStrategy_ = ErrorStrategy::Skip;
  UnitExistsStrategy unitExistsStrategy_ = UnitExistsStrategy::Drop;

public:
  void setThreadCount(size_t v);
  size_t threadCount() const { return threadCount_; }

  // 0 selects the destination's adaptive default.
  void setBatchSize(size_t v);
  size_t batchSize() const { return batchSize_; }

  void setReadPageSize(size_t v);
  size_t readPageSize() const { return readPageSize_; }

  void setProgressIntervalMs(size_t v);
  size_t progressIntervalMs() const { return progressIntervalMs_; }

  void setErrorStrategy(ErrorStrategy v) { errorStrategy_ = v; }
  ErrorStrategy errorStrategy() const { return errorStrategy_; }

  void setUnitExistsStrategy(UnitExistsStrategy v) { unitExistsStrategy_ = v; }
  UnitExistsStrategy unitExistsStrategy() const { return unitExistsStrategy_; }

  size_t effectiveBatchSize(size_t destinationDefault) const;
};

#endif
