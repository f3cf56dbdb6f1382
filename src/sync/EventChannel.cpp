#include "sync/EventChannel.h"

std::string syncEventKindToString(SyncEventKind kind) {
  switch (kind) {
  case SyncEventKind::Progress:
    return "progress";
  case SyncEventKind::ErrorLog:
    return "error_log";
  case SyncEventKind::StatusChange:
    return "status_change";
  }
  return "progress";
}

nlohmann::json SyncEvent::toJson() const {
  nlohmann::json j = {{"kind", syncEventKindToString(kind)},
                      {"taskId", taskId},
                      {"payload", payload}};
  if (!unit.empty())
    j["unit"] = unit;
  return j;
}

EventChannel::EventChannel(size_t capacity) : queue_(capacity) {}

void EventChannel::publish(SyncEvent event) {
  if (queue_.isFinished())
    return;
  if (queue_.push(std::move(event)))
    dropped_++;
}

bool EventChannel::publishProgress(const std::string &taskId,
                                   nlohmann::json payload,
                                   std::chrono::milliseconds minInterval,
                                   bool force) {
  auto now = std::chrono::steady_clock::now();
  {
    std::lock_guard<std::mutex> lock(throttleMutex_);
    auto it = lastProgress_.find(taskId);
    if (!force && it != lastProgress_.end() && now - it->second < minInterval)
      return false;
    lastProgress_[taskId] = now;
  }

  SyncEvent event;
  event.kind = SyncEventKind::Progress;
  event.taskId = taskId;
  event.payload = std::move(payload);
  publish(std::move(event));
  return true;
}

bool EventChannel::next(SyncEvent &event, std::chrono::milliseconds timeout) {
  return queue_.pop(event, timeout);
}
