#ifndef DESTINATIONWORKERPOOL_H
#define DESTINATIONWORKERPOOL_H

#include "core/logger.h"
#include "utils/ThreadSafeQueue.h"
#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>

struct DestinationTask {
  size_t index = 0;
  std::string destinationId;
  std::function<void()> work;
};

// Runs one task per destination on a fixed set of threads. Tasks must not
// let exceptions escape; a task that throws is counted and logged but its
// destination's result is whatever the task recorded before throwing.
class DestinationWorkerPool {
private:
  std::vector<std::thread> workers_;
  ThreadSafeQueue<DestinationTask> tasks_;
  std::atomic<size_t> activeWorkers_{0};
  std::atomic<size_t> completedTasks_{0};
  std::atomic<size_t> failedTasks_{0};
  std::atomic<bool> finished_{false};

  void workerThread(size_t workerId);

public:
  explicit DestinationWorkerPool(size_t numWorkers);
  ~DestinationWorkerPool();

  DestinationWorkerPool(const DestinationWorkerPool &) = delete;
  DestinationWorkerPool &operator=(const DestinationWorkerPool &) = delete;

  void submitTask(DestinationTask task);

  // Stops accepting tasks, drains the queue and joins all workers.
  void waitForCompletion();

  size_t completedTasks() const { return completedTasks_.load(); }
  size_t failedTasks() const { return failedTasks_.load(); }
  size_t totalWorkers() const { return workers_.size(); }
};

#endif
