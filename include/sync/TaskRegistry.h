#ifndef TASK_REGISTRY_H
#define TASK_REGISTRY_H

#include "core/Config.h"
#include "engines/database_engine.h"
#include "sync/ErrorSink.h"
#include "sync/ProgressAggregator.h"
#include "sync/TaskSignals.h"
#include "sync/TaskStateMachine.h"
#include "sync/UnitRuntime.h"
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// All state of one registered task. mutex serializes control operations on
// this task only; observers copy the shared pointers under it and read
// without holding it.
struct TaskHandle {
  TaskDefinition definition;
  std::shared_ptr<IUnitSource> source;
  std::shared_ptr<IUnitDestination> destination;

  std::mutex mutex;
  std::condition_variable controllerDone;
  bool controllerActive = false;
  std::thread controller;

  TaskStateMachine state;
  TaskSignals signals;
  ProgressAggregator progress;
  std::vector<SyncUnit> units;
  std::shared_ptr<UnitRuntimeTable> runtimes;
  std::shared_ptr<ErrorSink> errors;
};

// Process-scoped map of task id to handle. The registry mutex is held only
// to insert, look up or remove; it never spans work on a task.
class TaskRegistry {
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<TaskHandle>> tasks_;

public:
  // Returns false when the id is already registered.
  bool add(std::shared_ptr<TaskHandle> handle);
  std::shared_ptr<TaskHandle> find(const std::string &taskId) const;
  // Throws std::invalid_argument for unknown ids.
  std::shared_ptr<TaskHandle> get(const std::string &taskId) const;
  std::shared_ptr<TaskHandle> remove(const std::string &taskId);
  std::vector<std::string> taskIds() const;
  std::vector<std::shared_ptr<TaskHandle>> all() const;
};

#endif
