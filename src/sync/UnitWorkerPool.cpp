#include "sync/UnitWorkerPool.h"
#include "core/database_defaults.h"
#include "core/logger.h"
#include <algorithm>

// Starts numWorkers threads (at least one). holdClaims may be empty, in which
// case jobs are always claimed.
UnitWorkerPool::UnitWorkerPool(size_t numWorkers,
                               std::function<bool()> holdClaims)
    : holdClaims_(std::move(holdClaims)),
      activeLimit_(std::max<size_t>(1, numWorkers)) {
  numWorkers = activeLimit_;
  workers_.reserve(numWorkers);
  for (size_t i = 0; i < numWorkers; ++i) {
    workers_.emplace_back(&UnitWorkerPool::workerThread, this, i);
  }

  Logger::info(LogCategory::TRANSFER, "UnitWorkerPool",
               "Created worker pool with " + std::to_string(numWorkers) +
                   " workers");
}

UnitWorkerPool::~UnitWorkerPool() { shutdown(); }

// Each worker pops the next job, waits for a free slot under the current
// active limit, then runs the job. The hold check happens after the slot is
// granted, so a pause raised while the worker was waiting still keeps the
// unit from starting. Exceptions escaping a job are logged and counted; the
// pipeline is expected to have recorded the unit status itself.
void UnitWorkerPool::workerThread(size_t workerId) {
  Logger::debug(LogCategory::TRANSFER, "UnitWorkerPool",
                "Worker #" + std::to_string(workerId) + " started");

  while (!shutdown_.load()) {
    UnitJob job;
    if (!jobs_.popBlocking(job)) {
      break;
    }

    if (!acquireSlot()) {
      unclaimedUnits_++;
      break;
    }

    if (holdClaims_ && holdClaims_()) {
      releaseSlot();
      unclaimedUnits_++;
      Logger::debug(LogCategory::TRANSFER, "UnitWorkerPool",
                    "Worker #" + std::to_string(workerId) +
                        " left unit unclaimed: " + job.name);
      continue;
    }

    try {
      Logger::info(LogCategory::TRANSFER, "UnitWorkerPool",
                   "Worker #" + std::to_string(workerId) +
                       " processing unit: " + job.name);
      job.run(job.unitIndex);
      completedUnits_++;
    } catch (const std::exception &e) {
      failedUnits_++;
      Logger::error(LogCategory::TRANSFER, "UnitWorkerPool",
                    "Worker #" + std::to_string(workerId) +
                        " failed processing unit: " + job.name +
                        " - Error: " + std::string(e.what()));
    }

    releaseSlot();
  }

  Logger::debug(LogCategory::TRANSFER, "UnitWorkerPool",
                "Worker #" + std::to_string(workerId) + " stopped");
}

bool UnitWorkerPool::acquireSlot() {
  std::unique_lock<std::mutex> lock(limitMutex_);
  limitCv_.wait(lock, [this] {
    return running_ < activeLimit_ || shutdown_.load();
  });
  if (shutdown_.load())
    return false;
  running_++;
  return true;
}

void UnitWorkerPool::releaseSlot() {
  {
    std::lock_guard<std::mutex> lock(limitMutex_);
    running_--;
  }
  limitCv_.notify_one();
}

void UnitWorkerPool::submit(UnitJob job) {
  if (shutdown_.load()) {
    Logger::warning(LogCategory::TRANSFER, "UnitWorkerPool::submit",
                    "Cannot submit unit - pool is shutting down: " +
                        job.name);
    return;
  }
  jobs_.push(std::move(job));
  totalSubmitted_++;
}

void UnitWorkerPool::waitForCompletion() {
  jobs_.finish();

  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  Logger::info(LogCategory::TRANSFER, "UnitWorkerPool",
               "Units finished - Completed: " +
                   std::to_string(completedUnits_.load()) +
                   " | Failed: " + std::to_string(failedUnits_.load()) +
                   " | Unclaimed: " + std::to_string(unclaimedUnits_.load()) +
                   " of " + std::to_string(totalSubmitted_.load()));
}

// Stops accepting jobs and joins the workers. Running jobs finish normally;
// they observe stop through their own signals.
void UnitWorkerPool::shutdown() {
  if (shutdown_.exchange(true)) {
    return;
  }
  jobs_.finish();
  limitCv_.notify_all();

  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

/*
 * Resource pressure heuristic. A batch is "pressured" when the destination
 * rejected records for capacity reasons or the write took longer than
 * SLOW_BATCH_MILLIS. PRESSURE_STREAK_TO_SHRINK pressured batches in a row
 * lower the active limit by one (never below one); HEALTHY_STREAK_TO_GROW
 * healthy batches in a row raise it back by one, up to the pool size.
 * Streaks are pool-wide, not per unit.
 */
void UnitWorkerPool::reportBatch(std::chrono::milliseconds latency,
                                 bool rejected) {
  bool pressured =
      rejected || latency.count() >= DatabaseDefaults::SLOW_BATCH_MILLIS;
  bool grew = false;
  {
    std::lock_guard<std::mutex> lock(limitMutex_);
    if (pressured) {
      healthyStreak_ = 0;
      if (++pressureStreak_ >= DatabaseDefaults::PRESSURE_STREAK_TO_SHRINK) {
        pressureStreak_ = 0;
        if (activeLimit_ > 1) {
          activeLimit_--;
          Logger::warning(LogCategory::TRANSFER, "UnitWorkerPool",
                          "Sustained write pressure, active workers reduced "
                          "to " +
                              std::to_string(activeLimit_));
        }
      }
    } else {
      pressureStreak_ = 0;
      if (++healthyStreak_ >= DatabaseDefaults::HEALTHY_STREAK_TO_GROW) {
        healthyStreak_ = 0;
        if (activeLimit_ < workers_.size()) {
          activeLimit_++;
          grew = true;
          Logger::info(LogCategory::TRANSFER, "UnitWorkerPool",
                       "Write pressure eased, active workers raised to " +
                           std::to_string(activeLimit_));
        }
      }
    }
  }
  if (grew)
    limitCv_.notify_one();
}

size_t UnitWorkerPool::activeLimit() const {
  std::lock_guard<std::mutex> lock(limitMutex_);
  return activeLimit_;
}

size_t UnitWorkerPool::runningUnits() const {
  std::lock_guard<std::mutex> lock(limitMutex_);
  return running_;
}
