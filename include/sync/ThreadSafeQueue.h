#ifndef THREAD_SAFE_QUEUE_H
#define THREAD_SAFE_QUEUE_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <vector>

// FIFO shared by producers and consumers on different threads. A capacity
// of zero means unbounded; otherwise push() evicts the oldest item once the
// queue is full. finish() wakes every waiter; items pushed before it are
// still handed out, items pushed after it are kept but only reachable
// through drain().
template <typename T> class ThreadSafeQueue {
private:
  mutable std::mutex mtx;
  std::queue<T> queue;
  std::condition_variable cv;
  std::atomic<bool> finished{false};
  size_t capacity_;

  bool takeFront(T &item) {
    if (queue.empty())
      return false;
    item = std::move(queue.front());
    queue.pop();
    return true;
  }

public:
  explicit ThreadSafeQueue(size_t capacity = 0) : capacity_(capacity) {}

  // Returns true when an older item was evicted to make room.
  bool push(T item) {
    bool evicted = false;
    {
      std::lock_guard<std::mutex> lock(mtx);
      if (capacity_ > 0 && queue.size() >= capacity_) {
        queue.pop();
        evicted = true;
      }
      queue.push(std::move(item));
    }
    cv.notify_one();
    return evicted;
  }

  // Waits at most timeout for an item.
  bool pop(T &item, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait_for(lock, timeout, [this] { return !queue.empty() || finished; });
    return takeFront(item);
  }

  // Returns false only once the queue is finished and empty.
  bool popBlocking(T &item) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this] { return !queue.empty() || finished; });
    return takeFront(item);
  }

  std::vector<T> drain() {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<T> items;
    items.reserve(queue.size());
    T item;
    while (takeFront(item))
      items.push_back(std::move(item));
    return items;
  }

  void finish() {
    {
      std::lock_guard<std::mutex> lock(mtx);
      finished = true;
    }
    cv.notify_all();
  }

  bool isFinished() const { return finished.load(); }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return queue.size();
  }
};

#endif
