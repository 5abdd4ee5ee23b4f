#ifndef THREAD_POOL_HPP
#define THREAD_POOL_HPP

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace textbook {

/**
 * @brief Fixed-size worker pool used for page-parallel diagram extraction
 *
 * Exceptions thrown by a task are delivered through its future.
 */
class ThreadPool {
public:
  /**
   * @param threads Number of workers, 0 = hardware concurrency (at least 1)
   */
  explicit ThreadPool(size_t threads = 0) {
    size_t count = threads > 0
                       ? threads
                       : std::max(1u, std::thread::hardware_concurrency());
    m_workers.reserve(count);
    for (size_t i = 0; i < count; ++i) {
      m_workers.emplace_back([this] { workerLoop(); });
    }
  }

  ~ThreadPool() {
    {
      std::unique_lock<std::mutex> lock(m_queueMutex);
      m_stop = true;
    }
    m_condition.notify_all();
    for (auto &worker : m_workers) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  /**
   * @brief Queue a task
   * @return Future holding the task result or its exception
   * @throws std::runtime_error if the pool is stopping
   */
  template <typename F, typename... Args>
  auto enqueue(F &&f, Args &&...args)
      -> std::future<std::invoke_result_t<F, Args...>> {
    using ReturnType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<ReturnType> future = task->get_future();
    {
      std::unique_lock<std::mutex> lock(m_queueMutex);
      if (m_stop) {
        throw std::runtime_error("ThreadPool: enqueue on stopped pool");
      }
      ++m_pending;
      m_tasks.emplace([task]() { (*task)(); });
    }
    m_condition.notify_one();
    return future;
  }

  /**
   * @brief Block until every queued task has finished
   */
  void waitAll() {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    m_done.wait(lock, [this] { return m_pending == 0; });
  }

  size_t threadCount() const { return m_workers.size(); }

private:
  void workerLoop() {
    for (;;) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        m_condition.wait(lock, [this] { return m_stop || !m_tasks.empty(); });
        if (m_stop && m_tasks.empty()) {
          return;
        }
        task = std::move(m_tasks.front());
        m_tasks.pop();
      }

      // packaged_task stores exceptions in the future, so this never throws
      task();

      {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        --m_pending;
      }
      m_done.notify_all();
    }
  }

  std::vector<std::thread> m_workers;
  std::queue<std::function<void()>> m_tasks;
  std::mutex m_queueMutex;
  std::condition_variable m_condition;
  std::condition_variable m_done;
  bool m_stop = false;
  size_t m_pending = 0;
};

} // namespace textbook

#endif // THREAD_POOL_HPP
