#include "sync/TaskRegistry.h"
#include <stdexcept>

bool TaskRegistry::add(std::shared_ptr<TaskHandle> handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string id = handle->definition.taskId;
  return tasks_.emplace(std::move(id), std::move(handle)).second;
}

std::shared_ptr<TaskHandle>
TaskRegistry::find(const std::string &taskId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(taskId);
  return it == tasks_.end() ? nullptr : it->second;
}

std::shared_ptr<TaskHandle>
TaskRegistry::get(const std::string &taskId) const {
  auto handle = find(taskId);
  if (!handle)
    throw std::invalid_argument("Unknown task '" + taskId + "'");
  return handle;
}

std::shared_ptr<TaskHandle> TaskRegistry::remove(const std::string &taskId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(taskId);
  if (it == tasks_.end())
    return nullptr;
  auto handle = std::move(it->second);
  tasks_.erase(it);
  return handle;
}

std::vector<std::string> TaskRegistry::taskIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(tasks_.size());
  for (const auto &entry : tasks_)
    ids.push_back(entry.first);
  return ids;
}

std::vector<std::shared_ptr<TaskHandle>> TaskRegistry::all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<TaskHandle>> handles;
  handles.reserve(tasks_.size());
  for (const auto &entry : tasks_)
    handles.push_back(entry.second);
  return handles;
}
