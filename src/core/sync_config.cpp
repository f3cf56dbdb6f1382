#include "core/sync_config.h"
#include "utils/string_utils.h"

namespace {
void checkRange(const char *name, size_t value, size_t minValue,
                size_t maxValue) {
  if (value < minValue || value > maxValue) {
    throw std::invalid_argument(std::string(name) + " must be between " +
                                std::to_string(minValue) + " and " +
                                std::to_string(maxValue) + " (got " +
                                std::to_string(value) + ")");
  }
}
} // namespace

std::string errorStrategyToString(ErrorStrategy strategy) {
  return strategy == ErrorStrategy::Pause ? "pause" : "skip";
}

ErrorStrategy parseErrorStrategy(const std::string &value) {
  std::string lower = StringUtils::toLower(StringUtils::trim(value));
  if (lower == "skip")
    return ErrorStrategy::Skip;
  if (lower == "pause")
    return ErrorStrategy::Pause;
  throw std::invalid_argument("errorStrategy must be 'skip' or 'pause' (got '" +
                              value + "')");
}

std::string unitExistsStrategyToString(UnitExistsStrategy strategy) {
  switch (strategy) {
  case UnitExistsStrategy::Drop:
    return "drop";
  case UnitExistsStrategy::Truncate:
    return "truncate";
  case UnitExistsStrategy::Backup:
    return "backup";
  }
  return "drop";
}

UnitExistsStrategy parseUnitExistsStrategy(const std::string &value) {
  std::string lower = StringUtils::toLower(StringUtils::trim(value));
  if (lower == "drop")
    return UnitExistsStrategy::Drop;
  if (lower == "truncate")
    return UnitExistsStrategy::Truncate;
  if (lower == "backup")
    return UnitExistsStrategy::Backup;
  throw std::invalid_argument(
      "unitExistsStrategy must be 'drop', 'truncate' or 'backup' (got '" +
      value + "')");
}

void SyncConfig::setThreadCount(size_t v) {
  checkRange("threadCount", v, MIN_THREAD_COUNT, MAX_THREAD_COUNT);
  threadCount_ = v;
}

void SyncConfig::setBatchSize(size_t v) {
  if (v != 0)
    checkRange("batchSize", v, MIN_BATCH_SIZE, MAX_BATCH_SIZE);
  batchSize_ = v;
}

void SyncConfig::setReadPageSize(size_t v) {
  checkRange("readPageSize", v, MIN_READ_PAGE_SIZE, MAX_READ_PAGE_SIZE);
  readPageSize_ = v;
}

void SyncConfig::setProgressIntervalMs(size_t v) {
  checkRange("progressIntervalMs", v, MIN_PROGRESS_INTERVAL_MS,
             MAX_PROGRESS_INTERVAL_MS);
  progressIntervalMs_ = v;
}

size_t SyncConfig::effectiveBatchSize(size_t destinationDefault) const {
  if (batchSize_ != 0)
    return batchSize_;
  return destinationDefault == 0 ? DEFAULT_READ_PAGE_SIZE : destinationDefault;
}
