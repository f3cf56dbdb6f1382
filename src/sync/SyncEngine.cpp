#include "sync/SyncEngine.h"
#include "core/logger.h"
#include "sync/PipelineCoordinator.h"
#include "sync/UnitResolver.h"
#include "sync/UnitWorkerPool.h"
#include <new>
#include <stdexcept>

SyncEngine::SyncEngine(EventChannel &events) : events_(events) {}

SyncEngine::~SyncEngine() { shutdown(); }

void SyncEngine::registerTask(TaskDefinition definition,
                              std::shared_ptr<IUnitSource> source,
                              std::shared_ptr<IUnitDestination> destination) {
  if (!source || !destination) {
    throw std::invalid_argument("Task '" + definition.taskId +
                                "' needs both a source and a destination");
  }
  auto handle = std::make_shared<TaskHandle>();
  handle->definition = std::move(definition);
  handle->source = std::move(source);
  handle->destination = std::move(destination);
  std::string taskId = handle->definition.taskId;
  if (!registry_.add(std::move(handle))) {
    throw std::invalid_argument("Task '" + taskId + "' is already registered");
  }
  Logger::info(LogCategory::SYSTEM, "SyncEngine",
               "Registered task '" + taskId + "'");
}

void SyncEngine::publishTaskStatus(const TaskHandle &handle, TaskStatus status,
                                   const std::string &message) {
  SyncEvent event;
  event.kind = SyncEventKind::StatusChange;
  event.taskId = handle.definition.taskId;
  event.payload = {{"scope", "task"}, {"status", taskStatusToString(status)}};
  if (!message.empty())
    event.payload["message"] = message;
  events_.publish(std::move(event));
}

TaskProgress SyncEngine::computeProgress(TaskHandle &handle) {
  std::shared_ptr<UnitRuntimeTable> runtimes;
  std::shared_ptr<ErrorSink> errors;
  {
    std::lock_guard<std::mutex> lock(handle.mutex);
    runtimes = handle.runtimes;
    errors = handle.errors;
  }
  std::vector<UnitRuntime> units;
  if (runtimes)
    units = runtimes->snapshotAll();
  return handle.progress.compute(handle.state.status(), units,
                                 errors ? errors->errorCount() : 0);
}

void SyncEngine::publishProgress(TaskHandle &handle, bool force) {
  std::vector<UnitRuntime> units;
  size_t errorCount = 0;
  // Called from workers while the controller may hold the task mutex, so
  // this reads the run state through the pointers the run was started with.
  if (handle.runtimes)
    units = handle.runtimes->snapshotAll();
  if (handle.errors)
    errorCount = handle.errors->errorCount();
  TaskProgress snapshot =
      handle.progress.compute(handle.state.status(), units, errorCount);
  events_.publishProgress(
      handle.definition.taskId, snapshot.toJson(),
      std::chrono::milliseconds(handle.definition.sync.progressIntervalMs()),
      force);
}

/*
 * Start sequence. Connectivity comes first so an unreachable endpoint fails
 * the call before any unit exists. Totals are counted up front; a count
 * failure is only a warning because the unit itself will report the
 * underlying problem when its pipeline introspects the source.
 */
void SyncEngine::start(const std::string &taskId) {
  auto handle = registry_.get(taskId);
  std::unique_lock<std::mutex> lock(handle->mutex);

  TaskStatus current = handle->state.status();
  if (current == TaskStatus::Running || current == TaskStatus::Paused ||
      handle->controllerActive) {
    throw std::logic_error("Task '" + taskId + "' is " +
                           taskStatusToString(current) +
                           "; stop it before starting again");
  }
  joinController(*handle, lock);

  const TaskDefinition &definition = handle->definition;
  auto errors = std::make_shared<ErrorSink>(
      taskId, definition.sync.errorStrategy(), &events_);

  try {
    handle->source->ping();
    handle->destination->ping();
  } catch (const SyncError &e) {
    ConnectionError error(e.what(), e.unit(),
                          e.operation().empty() ? "ping" : e.operation());
    errors->recordFatal(error);
    handle->errors = errors;
    throw error;
  } catch (const std::bad_alloc &) {
    throw;
  } catch (const std::exception &e) {
    ConnectionError error(e.what(), "", "ping");
    errors->recordFatal(error);
    handle->errors = errors;
    throw error;
  }

  std::vector<SyncUnit> units =
      UnitResolver::resolve(definition, *handle->source);
  auto runtimes = std::make_shared<UnitRuntimeTable>(units);
  for (size_t i = 0; i < units.size(); ++i) {
    uint64_t total = 0;
    try {
      total = handle->source->countRecords(units[i].source);
    } catch (const SyncError &e) {
      errors->recordWarning(units[i].source,
                            std::string("could not count records: ") +
                                e.what(),
                            {{"operation", "count"}});
    }
    runtimes->update(i, [total](UnitRuntime &runtime) {
      runtime.totalRecords = total;
    });
  }

  handle->units = std::move(units);
  handle->runtimes = std::move(runtimes);
  handle->errors = std::move(errors);
  handle->signals.clear();
  handle->progress.markStarted();
  handle->state.transition(TaskStatus::Running);

  Logger::info(LogCategory::SYSTEM, "SyncEngine::start",
               "Task '" + taskId + "' started with " +
                   std::to_string(handle->units.size()) + " units, " +
                   std::to_string(definition.sync.threadCount()) +
                   " threads");
  publishTaskStatus(*handle, TaskStatus::Running);
  launchController(handle);
}

void SyncEngine::launchController(const std::shared_ptr<TaskHandle> &handle) {
  handle->controllerActive = true;
  handle->controller = std::thread(&SyncEngine::runController, this, handle);
}

// Runs one run segment: every unit still pending or paused goes through the
// pool. Returns once each worker has either finished its unit or declined to
// claim one because of a pause or stop.
void SyncEngine::runController(std::shared_ptr<TaskHandle> handle) {
  const TaskDefinition &definition = handle->definition;
  TaskHandle *task = handle.get();

  UnitWorkerPool pool(definition.sync.threadCount(), [task] {
    return task->signals.pauseRequested() ||
           task->signals.stopRequested() || task->errors->haltRequested();
  });

  PipelineContext ctx;
  ctx.taskId = definition.taskId;
  ctx.source = handle->source.get();
  ctx.destination = handle->destination.get();
  ctx.config = definition.sync;
  ctx.runtimes = handle->runtimes.get();
  ctx.errors = handle->errors.get();
  ctx.events = &events_;
  ctx.signals = &handle->signals;
  ctx.onBatchWritten = [&pool](std::chrono::milliseconds latency,
                               bool rejected) {
    pool.reportBatch(latency, rejected);
  };
  ctx.onProgress = [this, task] { publishProgress(*task, false); };

  for (size_t i = 0; i < ctx.runtimes->size(); ++i) {
    UnitRuntime runtime = ctx.runtimes->snapshot(i);
    if (runtime.status != UnitStatus::Pending &&
        runtime.status != UnitStatus::Paused)
      continue;
    pool.submit(UnitJob{i, runtime.unit.source, [&ctx](size_t unitIndex) {
                          PipelineCoordinator coordinator(ctx, unitIndex);
                          coordinator.run();
                        }});
  }
  pool.waitForCompletion();

  finishRun(*handle);
}

void SyncEngine::finishRun(TaskHandle &handle) {
  TaskStatus outcome;
  if (handle.signals.stopRequested()) {
    resetUnits(handle);
    outcome = TaskStatus::Idle;
  } else {
    bool pauseRequested =
        handle.signals.pauseRequested() || handle.errors->haltRequested();
    outcome = TaskStateMachine::resolveFinal(handle.runtimes->snapshotAll(),
                                           pauseRequested);
  }

  handle.state.transition(outcome);
  Logger::info(LogCategory::SYSTEM, "SyncEngine",
               "Task '" + handle.definition.taskId + "' is now " +
                   taskStatusToString(outcome));
  publishTaskStatus(handle, outcome);
  publishProgress(handle, true);

  {
    std::lock_guard<std::mutex> lock(handle.mutex);
    handle.controllerActive = false;
  }
  handle.controllerDone.notify_all();
}

void SyncEngine::resetUnits(TaskHandle &handle) {
  if (!handle.runtimes)
    return;
  for (size_t i = 0; i < handle.runtimes->size(); ++i) {
    handle.runtimes->update(
        i, [](UnitRuntime &runtime) { runtime.resetForRestart(); });
  }
}

// Waits for the controller to report completion, then reaps the thread.
// The caller holds lock on handle.mutex; it is released while waiting.
void SyncEngine::joinController(TaskHandle &handle,
                                std::unique_lock<std::mutex> &lock) {
  handle.controllerDone.wait(lock, [&handle] {
    return !handle.controllerActive;
  });
  if (handle.controller.joinable())
    handle.controller.join();
}

bool SyncEngine::pause(const std::string &taskId) {
  auto handle = registry_.get(taskId);
  std::lock_guard<std::mutex> lock(handle->mutex);
  if (handle->state.status() != TaskStatus::Running)
    return false;
  handle->signals.requestPause();
  Logger::info(LogCategory::SYSTEM, "SyncEngine::pause",
               "Pause requested for task '" + taskId + "'");
  return true;
}

bool SyncEngine::resume(const std::string &taskId) {
  auto handle = registry_.get(taskId);
  std::unique_lock<std::mutex> lock(handle->mutex);
  joinController(*handle, lock);
  if (handle->state.status() != TaskStatus::Paused)
    return false;

  handle->signals.clear();
  handle->errors->resetHalt();
  handle->state.transition(TaskStatus::Running);
  Logger::info(LogCategory::SYSTEM, "SyncEngine::resume",
               "Resuming task '" + taskId + "'");
  publishTaskStatus(*handle, TaskStatus::Running);
  launchController(handle);
  return true;
}

void SyncEngine::stop(const std::string &taskId) {
  auto handle = registry_.get(taskId);
  std::unique_lock<std::mutex> lock(handle->mutex);
  if (handle->controllerActive) {
    handle->signals.requestStop();
    Logger::info(LogCategory::SYSTEM, "SyncEngine::stop",
                 "Stop requested for task '" + taskId + "'");
    joinController(*handle, lock);
    return;
  }
  joinController(*handle, lock);

  resetUnits(*handle);
  if (handle->state.status() != TaskStatus::Idle) {
    handle->state.transition(TaskStatus::Idle);
    publishTaskStatus(*handle, TaskStatus::Idle);
  }
}

TaskStatus SyncEngine::wait(const std::string &taskId) {
  auto handle = registry_.get(taskId);
  std::unique_lock<std::mutex> lock(handle->mutex);
  handle->controllerDone.wait(lock,
                              [&handle] { return !handle->controllerActive; });
  return handle->state.status();
}

bool SyncEngine::waitFor(const std::string &taskId,
                         std::chrono::milliseconds timeout) {
  auto handle = registry_.get(taskId);
  std::unique_lock<std::mutex> lock(handle->mutex);
  return handle->controllerDone.wait_for(
      lock, timeout, [&handle] { return !handle->controllerActive; });
}

TaskProgress SyncEngine::progress(const std::string &taskId) {
  return computeProgress(*registry_.get(taskId));
}

std::vector<ErrorLogEntry> SyncEngine::errors(const std::string &taskId) {
  auto handle = registry_.get(taskId);
  std::shared_ptr<ErrorSink> errors;
  {
    std::lock_guard<std::mutex> lock(handle->mutex);
    errors = handle->errors;
  }
  return errors ? errors->entries() : std::vector<ErrorLogEntry>{};
}

std::vector<UnitRuntime> SyncEngine::unitRuntimes(const std::string &taskId) {
  auto handle = registry_.get(taskId);
  std::shared_ptr<UnitRuntimeTable> runtimes;
  {
    std::lock_guard<std::mutex> lock(handle->mutex);
    runtimes = handle->runtimes;
  }
  return runtimes ? runtimes->snapshotAll() : std::vector<UnitRuntime>{};
}

TaskStatus SyncEngine::status(const std::string &taskId) {
  return registry_.get(taskId)->state.status();
}

void SyncEngine::release(const std::string &taskId) {
  auto handle = registry_.find(taskId);
  if (!handle)
    return;
  stop(taskId);
  registry_.remove(taskId);
  Logger::info(LogCategory::SYSTEM, "SyncEngine",
               "Released task '" + taskId + "'");
}

void SyncEngine::shutdown() {
  for (const auto &taskId : registry_.taskIds()) {
    release(taskId);
  }
}
