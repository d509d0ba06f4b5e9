/**
 * @file ThreadPool.cpp
 * @brief Worker pool for parallel searchlight evaluation
 */

#include "ThreadPool.h"

namespace neurodecode {

size_t ThreadPool::DefaultThreadCount() {
  size_t num_threads = std::thread::hardware_concurrency();
  return num_threads == 0 ? 4 : num_threads;
}

ThreadPool::ThreadPool(size_t num_threads) : m_stop(false) {
  if (num_threads == 0) {
    num_threads = DefaultThreadCount();
  }

  for (size_t i = 0; i < num_threads; ++i) {
    m_workers.emplace_back([this] {
      for (;;) {
        std::function<void()> task;

        {
          std::unique_lock<std::mutex> lock(this->m_queue_mutex);
          this->m_condition.wait(
              lock, [this] { return this->m_stop || !this->m_tasks.empty(); });

          if (this->m_stop && this->m_tasks.empty()) {
            return;
          }

          task = std::move(this->m_tasks.front());
          this->m_tasks.pop();
        }

        task();
      }
    });
  }
}

/**
 * @brief Drains the queue, then joins every worker
 */
ThreadPool::~ThreadPool() {
  {
    std::unique_lock<std::mutex> lock(m_queue_mutex);
    m_stop = true;
  }

  m_condition.notify_all();

  for (std::thread &worker : m_workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

} // namespace neurodecode
