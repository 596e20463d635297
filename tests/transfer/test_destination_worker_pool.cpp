#include "../TestRunner.h"
#include "transfer/DestinationWorkerPool.h"
#include <atomic>
#include <stdexcept>
#include <thread>

int main() {
  TestRunner runner;

  runner.runTest("Every submitted task runs once", [&]() {
    std::vector<std::atomic<int>> runs(8);
    {
      DestinationWorkerPool pool(3);
      for (size_t i = 0; i < runs.size(); ++i) {
        pool.submitTask(
            DestinationTask{i, "dest" + std::to_string(i), [&runs, i]() {
                              runs[i]++;
                            }});
      }
      pool.waitForCompletion();
      runner.assertCount(8, pool.completedTasks(), "all completed");
      runner.assertCount(0, pool.failedTasks(), "none failed");
    }
    for (auto &count : runs) {
      runner.assertEquals(1, count.load(), "ran exactly once");
    }
  });

  runner.runTest("A throwing task does not stop the others", [&]() {
    std::atomic<int> finished{0};
    DestinationWorkerPool pool(2);
    pool.submitTask(DestinationTask{0, "dest1", []() {
                                      throw std::runtime_error("boom");
                                    }});
    pool.submitTask(DestinationTask{1, "dest2", [&]() { finished++; }});
    pool.submitTask(DestinationTask{2, "dest3", [&]() { finished++; }});
    pool.waitForCompletion();
    runner.assertCount(1, pool.failedTasks(), "one failure counted");
    runner.assertEquals(2, finished.load(), "others finished");
  });

  runner.runTest("Tasks after completion are refused", [&]() {
    std::atomic<int> ran{0};
    DestinationWorkerPool pool(1);
    pool.waitForCompletion();
    pool.submitTask(DestinationTask{0, "late", [&]() { ran++; }});
    runner.assertEquals(0, ran.load(), "late task not run");
    runner.assertCount(1, pool.totalWorkers(), "one worker");
  });

  runner.runTest("Idle workers wake when the pool finishes", [&]() {
    for (int round = 0; round < 200; ++round) {
      DestinationWorkerPool pool(4);
      pool.waitForCompletion();
    }
    runner.assertTrue(true, "every idle pool joined");

    ThreadSafeQueue<int> queue;
    std::atomic<bool> popped{true};
    std::thread consumer([&]() {
      int item = 0;
      popped = queue.popBlocking(item);
    });
    queue.finish();
    consumer.join();
    runner.assertFalse(popped.load(), "blocked consumer released empty");
  });

  runner.printSummary();
  return 0;
}
