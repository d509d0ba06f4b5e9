#ifndef NEURODECODE_THREAD_POOL_H
#define NEURODECODE_THREAD_POOL_H

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

#include "NeuroDecodeExceptions.h"

namespace neurodecode {

/**
 * @brief Fixed-size worker pool used to spread searchlights over cores
 *
 * Tasks are run in submission order by whichever worker is free. Exceptions
 * thrown by a task are captured in the future returned by Enqueue.
 */
class ThreadPool {
private:
  std::vector<std::thread> m_workers;
  std::queue<std::function<void()>> m_tasks;
  std::mutex m_queue_mutex;
  std::condition_variable m_condition;
  std::atomic<bool> m_stop;

public:
  explicit ThreadPool(size_t num_threads = 0);
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  template <class F, class... Args>
  auto Enqueue(F &&f, Args &&...args)
      -> std::future<typename std::result_of<F(Args...)>::type>;

  size_t GetNumThreads() const { return m_workers.size(); }

  /// Worker count used when 0 is requested.
  static size_t DefaultThreadCount();
};

template <class F, class... Args>
auto ThreadPool::Enqueue(F &&f, Args &&...args)
    -> std::future<typename std::result_of<F(Args...)>::type> {
  using return_type = typename std::result_of<F(Args...)>::type;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...));

  std::future<return_type> res = task->get_future();

  {
    std::unique_lock<std::mutex> lock(m_queue_mutex);

    if (m_stop) {
      throw ResourceException("ThreadPool", "enqueue on stopped pool");
    }

    m_tasks.emplace([task]() { (*task)(); });
  }

  m_condition.notify_one();
  return res;
}

} // namespace neurodecode

#endif // NEURODECODE_THREAD_POOL_H
