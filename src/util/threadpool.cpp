// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/threadpool.hpp"
#include "util/logging.hpp"

namespace tyr {
namespace util {

ThreadPool::ThreadPool(size_t num_threads, size_t max_queue_size, std::string name)
    : name_(std::move(name)), max_queue_size_(max_queue_size) {
  if (num_threads == 0) {
    num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0) {
      num_threads = 4;
    }
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back([this, i] { worker_loop(i); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
  wait_for_completion();
}

void ThreadPool::worker_loop(size_t index) {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      condition_.wait(lock, [this] {
        return stop_.load(std::memory_order_acquire) || !tasks_.empty();
      });
      if (stop_.load(std::memory_order_acquire) && tasks_.empty()) {
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop();
    }

    // packaged_task stores task exceptions in the future; anything that
    // escapes here is a bug in the wrapper itself.
    try {
      task();
      tasks_completed_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception &e) {
      task_exceptions_.fetch_add(1, std::memory_order_relaxed);
      LOG_ERROR("ThreadPool {} worker {} caught exception: {}", name_, index, e.what());
    }
  }
}

void ThreadPool::shutdown() {
  stop_.store(true, std::memory_order_release);
  condition_.notify_all();
}

void ThreadPool::wait_for_completion() {
  for (std::thread &worker : workers_) {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
      worker.join();
    }
  }
}

} // namespace util
} // namespace tyr
