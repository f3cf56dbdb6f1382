#ifndef PIPELINE_COORDINATOR_H
#define PIPELINE_COORDINATOR_H

#include "core/sync_config.h"
#include "engines/database_engine.h"
#include "sync/ErrorSink.h"
#include "sync/EventChannel.h"
#include "sync/TaskSignals.h"
#include "sync/UnitRuntime.h"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

enum class PipelineOutcome {
  // Pause or stop was already raised when the worker claimed the unit.
  NotStarted,
  Completed,
  Paused,
  Stopped,
  Failed
};

std::string pipelineOutcomeToString(PipelineOutcome outcome);

// Everything a unit pipeline shares with the rest of its task. Pointers are
// owned by the task and outlive every pipeline of the run.
struct PipelineContext {
  std::string taskId;
  IUnitSource *source = nullptr;
  IUnitDestination *destination = nullptr;
  SyncConfig config;
  UnitRuntimeTable *runtimes = nullptr;
  ErrorSink *errors = nullptr;
  EventChannel *events = nullptr;
  const TaskSignals *signals = nullptr;

  // Write latency and whether the destination pushed back, per batch.
  std::function<void(std::chrono::milliseconds, bool)> onBatchWritten;
  // Invoked after every runtime update that moves progress.
  std::function<void()> onProgress;
};

// Drives one unit from pending to a terminal or paused state:
// describe and provision the destination, then read, convert and write in
// batches of at most the effective batch size. Pause and stop are honored
// only between batches.
class PipelineCoordinator {
  const PipelineContext &ctx_;
  size_t unitIndex_;
  SyncUnit unit_;

  struct PendingBatch {
    std::vector<Record> records;
    // Source offset of each converted record, for error context.
    std::vector<uint64_t> offsets;
    std::vector<std::pair<uint64_t, std::string>> conversionFailures;
    size_t consumed = 0;
  };

  bool holdRequested() const;
  void setStatus(UnitStatus status, const std::string &message = "");
  void publishStatus(UnitStatus status, const std::string &message);

  void prepare();
  PipelineOutcome transfer();
  PipelineOutcome handleFailure(const SyncError &error);
  bool applyFailures(const PendingBatch &batch, const WriteResult &result,
                     bool &rejected);
  WriteResult failWholeBatch(const PendingBatch &batch, const DataError &error);

public:
  PipelineCoordinator(const PipelineContext &ctx, size_t unitIndex);

  // Never throws for unit-level problems; they end up in the unit status
  // and the error sink.
  PipelineOutcome run();
};

#endif
