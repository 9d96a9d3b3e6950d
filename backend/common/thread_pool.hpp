#pragma once

#include <vector>
#include <thread>
#include <future>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <stdexcept>
#include <string>

namespace common {

// Fixed-size worker pool. Work beyond the pool size waits in a FIFO queue.
class ThreadPool {
public:
  explicit ThreadPool(unsigned int size = std::thread::hardware_concurrency(),
                      std::string name = "pool");
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  template <typename Func, typename... Args>
  auto commit(Func&& func, Args&&... args) -> std::future<std::invoke_result_t<Func, Args...>> {
    using ReturnType = std::invoke_result_t<Func, Args...>;

    if (_stop.load(std::memory_order_relaxed)) {
      throw std::runtime_error("ThreadPool " + _name + " is stopped");
    }

    auto task = std::packaged_task<ReturnType()>(
      [func = std::forward<Func>(func), ... args = std::forward<Args>(args)]() mutable -> ReturnType {
        return func(args...);
      });

    auto ret = task.get_future();
    {
      std::lock_guard<std::mutex> lock{_mtx};
      _tasks.emplace([task = std::move(task)]() mutable -> void {
        task();
      });
    }
    _cv.notify_one();
    return ret;
  }

  size_t size() const { return _poolSize; }
  size_t queued() const;
  size_t active() const { return _active.load(std::memory_order_acquire); }

private:
  using Task = std::packaged_task<void()>;

  void workerLoop();

  mutable std::mutex _mtx;
  std::condition_variable _cv;

  std::queue<Task> _tasks;
  std::vector<std::jthread> _threads;

  std::atomic_bool _stop{false};
  std::atomic<size_t> _active{0};
  size_t _poolSize{0};
  std::string _name;
};

} // namespace common
