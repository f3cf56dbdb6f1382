#ifndef TASK_STATE_MACHINE_H
#define TASK_STATE_MACHINE_H

#include "sync/UnitRuntime.h"
#include <mutex>
#include <string>
#include <vector>

enum class TaskStatus { Idle, Running, Paused, Completed, Failed };

std::string taskStatusToString(TaskStatus status);

// Externally visible task lifecycle:
//   idle -> running -> (paused <-> running)* -> completed | failed
// stop returns any state to idle; completed and failed may start again.
class TaskStateMachine {
  mutable std::mutex mutex_;
  TaskStatus status_ = TaskStatus::Idle;

public:
  static bool canTransition(TaskStatus from, TaskStatus to);

  // Applies the transition when it is legal; returns false and leaves the
  // state untouched otherwise.
  bool transition(TaskStatus to);
  TaskStatus status() const;

  // Status a run ends in, given its units once every worker has returned.
  static TaskStatus resolveFinal(const std::vector<UnitRuntime> &units,
                                 bool pauseRequested);
};

#endif
