#ifndef UNIT_WORKER_POOL_H
#define UNIT_WORKER_POOL_H

#include "sync/ThreadSafeQueue.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct UnitJob {
  size_t unitIndex = 0;
  std::string name;
  std::function<void(size_t)> run;
};

// Runs one unit pipeline per claimed job on a fixed set of workers. The
// number of workers allowed to run a unit at the same time starts at the
// pool size and shrinks under sustained write pressure; queued jobs are
// never dropped because of it.
class UnitWorkerPool {
private:
  std::vector<std::thread> workers_;
  ThreadSafeQueue<UnitJob> jobs_;
  // Checked before claiming each job; true while pause or stop is pending.
  std::function<bool()> holdClaims_;

  mutable std::mutex limitMutex_;
  std::condition_variable limitCv_;
  size_t activeLimit_;
  size_t running_ = 0;
  int pressureStreak_ = 0;
  int healthyStreak_ = 0;

  std::atomic<size_t> completedUnits_{0};
  std::atomic<size_t> failedUnits_{0};
  std::atomic<size_t> unclaimedUnits_{0};
  std::atomic<size_t> totalSubmitted_{0};
  std::atomic<bool> shutdown_{false};

  void workerThread(size_t workerId);
  bool acquireSlot();
  void releaseSlot();

public:
  UnitWorkerPool(size_t numWorkers, std::function<bool()> holdClaims);
  ~UnitWorkerPool();

  UnitWorkerPool(const UnitWorkerPool &) = delete;
  UnitWorkerPool &operator=(const UnitWorkerPool &) = delete;

  void submit(UnitJob job);

  // Closes the queue and joins every worker. Jobs still queued when a hold
  // is active are skipped and counted as unclaimed.
  void waitForCompletion();
  void shutdown();

  // Fed by pipelines after each batch write.
  void reportBatch(std::chrono::milliseconds latency, bool rejected);

  size_t activeLimit() const;
  size_t runningUnits() const;
  size_t completedUnits() const { return completedUnits_.load(); }
  size_t failedUnits() const { return failedUnits_.load(); }
  size_t unclaimedUnits() const { return unclaimedUnits_.load(); }
  size_t pendingUnits() const { return jobs_.size(); }
  size_t totalWorkers() const { return workers_.size(); }
};

#endif
