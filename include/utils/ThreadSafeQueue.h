#ifndef THREADSAFEQUEUE_H
#define THREADSAFEQUEUE_H

#include <condition_variable>
#include <mutex>
#include <queue>

template <typename T> class ThreadSafeQueue {
private:
  std::mutex mtx;
  std::queue<T> queue;
  std::condition_variable cv;
  bool shutdown = false;

public:
  void push(T item) {
    std::lock_guard<std::mutex> lock(mtx);
    queue.push(std::move(item));
    cv.notify_one();
  }

  // Signals consumers that no more items will arrive. Items already queued
  // are still handed out.
  void finish() {
    std::lock_guard<std::mutex> lock(mtx);
    shutdown = true;
    cv.notify_all();
  }

  // Blocks until an item is available or the queue is finished and drained.
  bool popBlocking(T &item) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this] { return !queue.empty() || shutdown; });

    if (queue.empty()) {
      return false;
    }

    item = std::move(queue.front());
    queue.pop();
    return true;
  }
};

#endif
