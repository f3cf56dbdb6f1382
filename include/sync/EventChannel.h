#ifndef EVENT_CHANNEL_H
#define EVENT_CHANNEL_H

#include "sync/ThreadSafeQueue.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

enum class SyncEventKind { Progress, ErrorLog, StatusChange };

std::string syncEventKindToString(SyncEventKind kind);

struct SyncEvent {
  SyncEventKind kind = SyncEventKind::Progress;
  std::string taskId;
  // Empty for task-level events.
  std::string unit;
  nlohmann::json payload;

  nlohmann::json toJson() const;
};

// Outbound queue between the engine and whatever transport delivers events
// to operators. The engine only pushes; consumers pull with next() or
// drain(). Holds at most capacity events: when nobody drains, the oldest
// are discarded and counted in droppedEvents().
class EventChannel {
public:
  static constexpr size_t DEFAULT_CAPACITY = 10000;

private:
  ThreadSafeQueue<SyncEvent> queue_;
  std::atomic<size_t> dropped_{0};
  std::mutex throttleMutex_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point>
      lastProgress_;

public:
  explicit EventChannel(size_t capacity = DEFAULT_CAPACITY);

  void publish(SyncEvent event);

  // Drops the snapshot when the previous one for the same task went out less
  // than minInterval ago, unless force is set. Returns whether it was queued.
  bool publishProgress(const std::string &taskId, nlohmann::json payload,
                       std::chrono::milliseconds minInterval, bool force);

  bool next(SyncEvent &event, std::chrono::milliseconds timeout);
  std::vector<SyncEvent> drain() { return queue_.drain(); }
  size_t pending() const { return queue_.size(); }
  size_t droppedEvents() const { return dropped_.load(); }

  // Wakes blocked consumers; events already queued can still be drained.
  void close() { queue_.finish(); }
  bool closed() const { return queue_.isFinished(); }
};

#endif
