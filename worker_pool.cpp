// worker_pool.cpp
#include "worker_pool.h"
#include <iostream>
#include <stdexcept>

WorkerPool::WorkerPool(size_t threads) {
  if (threads == 0) {
    throw std::invalid_argument("WorkerPool requires at least one thread");
  }
  for (size_t i = 0; i < threads; ++i) {
    workers.emplace_back(&WorkerPool::workerLoop, this);
  }
}

WorkerPool::~WorkerPool() { shutdown(); }

void WorkerPool::submit(PoolTask task) {
  {
    std::lock_guard<std::mutex> lock(queueMutex);
    if (stopThreads) {
      throw std::logic_error("submit() on a stopped WorkerPool");
    }
    taskQueue.push(std::move(task));
  }
  queueCond.notify_one();
}

size_t WorkerPool::discardPending() {
  std::lock_guard<std::mutex> lock(queueMutex);
  size_t dropped = taskQueue.size();
  std::queue<PoolTask> empty;
  std::swap(taskQueue, empty);
  return dropped;
}

void WorkerPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(queueMutex);
    stopThreads = true;
  }
  queueCond.notify_all();

  for (auto &t : workers) {
    if (t.joinable())
      t.join();
  }
}

void WorkerPool::workerLoop() {
  while (true) {
    PoolTask task;
    {
      std::unique_lock<std::mutex> lock(queueMutex);
      queueCond.wait(lock,
                     [this]() { return stopThreads || !taskQueue.empty(); });
      if (stopThreads && taskQueue.empty())
        break;
      task = std::move(taskQueue.front());
      taskQueue.pop();
    }

    try {
      task();
    } catch (const std::exception &e) {
      std::cerr << "[Error] Worker task threw: " << e.what() << std::endl;
    }
  }
}
