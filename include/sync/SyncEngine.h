#ifndef SYNC_ENGINE_H
#define SYNC_ENGINE_H

#include "sync/EventChannel.h"
#include "sync/TaskRegistry.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

// Control surface of the engine. Every operation addresses one registered
// task; operations on different tasks never contend beyond the registry
// lookup.
class SyncEngine {
  EventChannel &events_;
  TaskRegistry registry_;

  void launchController(const std::shared_ptr<TaskHandle> &handle);
  void runController(std::shared_ptr<TaskHandle> handle);
  void finishRun(TaskHandle &handle);
  void resetUnits(TaskHandle &handle);
  void joinController(TaskHandle &handle, std::unique_lock<std::mutex> &lock);
  void publishTaskStatus(const TaskHandle &handle, TaskStatus status,
                         const std::string &message = "");
  void publishProgress(TaskHandle &handle, bool force);
  TaskProgress computeProgress(TaskHandle &handle);

public:
  explicit SyncEngine(EventChannel &events);
  ~SyncEngine();

  SyncEngine(const SyncEngine &) = delete;
  SyncEngine &operator=(const SyncEngine &) = delete;

  // Throws std::invalid_argument if the id is taken or an endpoint is
  // missing.
  void registerTask(TaskDefinition definition,
                    std::shared_ptr<IUnitSource> source,
                    std::shared_ptr<IUnitDestination> destination);

  // Checks both endpoints, resolves units, counts records and launches the
  // workers. Throws ConnectionError when an endpoint is unreachable (nothing
  // is started), std::invalid_argument when the selection is empty and
  // std::logic_error when the task is running or paused.
  void start(const std::string &taskId);
  // Returns false when the task is not running.
  bool pause(const std::string &taskId);
  // Returns false when the task is not paused.
  bool resume(const std::string &taskId);
  // Stops cooperatively and resets every unit to pending.
  void stop(const std::string &taskId);

  // Blocks until the current run segment ends; returns the resulting status.
  TaskStatus wait(const std::string &taskId);
  // Same with a deadline; returns false on timeout.
  bool waitFor(const std::string &taskId, std::chrono::milliseconds timeout);

  TaskProgress progress(const std::string &taskId);
  std::vector<ErrorLogEntry> errors(const std::string &taskId);
  std::vector<UnitRuntime> unitRuntimes(const std::string &taskId);
  TaskStatus status(const std::string &taskId);
  std::vector<std::string> taskIds() const { return registry_.taskIds(); }

  // Stops the task if needed and drops it from the registry.
  void release(const std::string &taskId);
  void shutdown();
};

#endif
