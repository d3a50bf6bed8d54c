// worker_pool.h
#pragma once
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

using PoolTask = std::function<void()>;

// Fixed-size thread pool fed from a FIFO queue. Exceptions escaping a task are
// logged and dropped so a worker never dies with the pool.
class WorkerPool {
public:
  explicit WorkerPool(size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  void submit(PoolTask task);

  // Drops queued tasks that have not started. Returns how many were dropped.
  size_t discardPending();

  // Runs the remaining queue, then joins all workers. Idempotent.
  void shutdown();

  size_t size() const { return workers.size(); }

private:
  void workerLoop();

  std::vector<std::thread> workers;
  std::queue<PoolTask> taskQueue;
  std::mutex queueMutex;
  std::condition_variable queueCond;
  bool stopThreads = false;
};
