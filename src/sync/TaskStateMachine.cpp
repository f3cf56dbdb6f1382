#include "sync/TaskStateMachine.h"

std::string taskStatusToString(TaskStatus status) {
  switch (status) {
  case TaskStatus::Idle:
    return "idle";
  case TaskStatus::Running:
    return "running";
  case TaskStatus::Paused:
    return "paused";
  case TaskStatus::Completed:
    return "completed";
  case TaskStatus::Failed:
    return "failed";
  }
  return "idle";
}

bool TaskStateMachine::canTransition(TaskStatus from, TaskStatus to) {
  if (to == TaskStatus::Idle)
    return true;
  switch (from) {
  case TaskStatus::Idle:
  case TaskStatus::Completed:
  case TaskStatus::Failed:
    return to == TaskStatus::Running;
  case TaskStatus::Running:
    return to == TaskStatus::Paused || to == TaskStatus::Completed ||
           to == TaskStatus::Failed;
  case TaskStatus::Paused:
    return to == TaskStatus::Running || to == TaskStatus::Failed;
  }
  return false;
}

bool TaskStateMachine::transition(TaskStatus to) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!canTransition(status_, to))
    return false;
  status_ = to;
  return true;
}

TaskStatus TaskStateMachine::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

// Paused wins over failed: a paused unit can still be resumed, so the task
// stays resumable even if another unit failed for good.
TaskStatus
TaskStateMachine::resolveFinal(const std::vector<UnitRuntime> &units,
                               bool pauseRequested) {
  bool anyPaused = false;
  bool anyFailed = false;
  bool anyUnfinished = false;

  for (const auto &unit : units) {
    switch (unit.status) {
    case UnitStatus::Paused:
      anyPaused = true;
      break;
    case UnitStatus::Failed:
      anyFailed = true;
      break;
    case UnitStatus::Pending:
    case UnitStatus::Running:
      anyUnfinished = true;
      break;
    case UnitStatus::Completed:
      break;
    }
  }

  if (anyPaused || (pauseRequested && anyUnfinished))
    return TaskStatus::Paused;
  if (anyFailed)
    return TaskStatus::Failed;
  if (anyUnfinished)
    return TaskStatus::Paused;
  return TaskStatus::Completed;
}
