#include "transfer/DestinationWorkerPool.h"
#include <algorithm>

DestinationWorkerPool::DestinationWorkerPool(size_t numWorkers) {
  if (numWorkers == 0) {
    numWorkers = std::max<size_t>(1, std::thread::hardware_concurrency());
    Logger::warning(LogCategory::TRANSFER, "DestinationWorkerPool",
                    "numWorkers was 0, using hardware_concurrency: " +
                        std::to_string(numWorkers));
  }

  workers_.reserve(numWorkers);
  for (size_t i = 0; i < numWorkers; ++i) {
    workers_.emplace_back(&DestinationWorkerPool::workerThread, this, i);
  }

  Logger::debug(LogCategory::TRANSFER, "DestinationWorkerPool",
                "Created worker pool with " + std::to_string(numWorkers) +
                    " workers");
}

DestinationWorkerPool::~DestinationWorkerPool() { waitForCompletion(); }

void DestinationWorkerPool::workerThread(size_t workerId) {
  DestinationTask task;
  while (tasks_.popBlocking(task)) {
    activeWorkers_++;

    try {
      Logger::debug(LogCategory::TRANSFER, "DestinationWorkerPool",
                    "Worker #" + std::to_string(workerId) +
                        " processing destination: " + task.destinationId);
      task.work();
      completedTasks_++;
    } catch (const std::exception &e) {
      failedTasks_++;
      Logger::error(LogCategory::TRANSFER, "DestinationWorkerPool",
                    "Worker #" + std::to_string(workerId) +
                        " failed processing destination: " +
                        task.destinationId + " - Error: " + e.what());
    }

    activeWorkers_--;
  }
}

void DestinationWorkerPool::submitTask(DestinationTask task) {
  if (finished_.load()) {
    Logger::warning(LogCategory::TRANSFER, "DestinationWorkerPool",
                    "Cannot submit task - pool is finishing: " +
                        task.destinationId);
    return;
  }
  tasks_.push(std::move(task));
}

void DestinationWorkerPool::waitForCompletion() {
  if (finished_.exchange(true)) {
    return;
  }

  tasks_.finish();

  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  Logger::debug(LogCategory::TRANSFER, "DestinationWorkerPool",
                "All destination tasks finished - Completed: " +
                    std::to_string(completedTasks_.load()) +
                    " | Failed: " + std::to_string(failedTasks_.load()));
}
