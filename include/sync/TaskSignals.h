#ifndef TASK_SIGNALS_H
#define TASK_SIGNALS_H

#include <atomic>

// Task-wide control flags. Written by the control surface, read by workers
// at batch boundaries only. Release/acquire ordering makes a request visible
// to every worker by its next boundary check.
class TaskSignals {
  std::atomic<bool> pauseRequested_{false};
  std::atomic<bool> stopRequested_{false};

public:
  void requestPause() { pauseRequested_.store(true, std::memory_order_release); }
  void requestStop() { stopRequested_.store(true, std::memory_order_release); }

  void clear() {
    pauseRequested_.store(false, std::memory_order_release);
    stopRequested_.store(false, std::memory_order_release);
  }

  bool pauseRequested() const {
    return pauseRequested_.load(std::memory_order_acquire);
  }
  bool stopRequested() const {
    return stopRequested_.load(std::memory_order_acquire);
  }
};

#endif
