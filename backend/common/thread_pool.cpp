#include "thread_pool.hpp"

namespace common {

ThreadPool::ThreadPool(unsigned int size, std::string name) : _name(std::move(name)) {
  if (size < 1) {
    _poolSize = 2;
  } else {
    _poolSize = size;
  }
  _threads.reserve(_poolSize);

  for (unsigned int i = 0; i < _poolSize; i++) {
    _threads.emplace_back([this]() -> void { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  _stop.store(true, std::memory_order_release);
  _cv.notify_all();
  // queued tasks are drained before the workers exit
  for (auto& t : _threads) {
    if (t.joinable()) {
      t.join();
    }
  }
}

size_t ThreadPool::queued() const {
  std::lock_guard<std::mutex> lock{_mtx};
  return _tasks.size();
}

void ThreadPool::workerLoop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock{_mtx};
      _cv.wait(lock, [this]() -> bool {
        return _stop.load(std::memory_order_acquire) || !_tasks.empty();
      });

      if (_stop.load(std::memory_order_acquire) && _tasks.empty()) {
        break;
      }

      task = std::move(_tasks.front());
      _tasks.pop();
      _active.fetch_add(1, std::memory_order_acq_rel);
    }
    task();
    _active.fetch_sub(1, std::memory_order_acq_rel);
  }
}

} // namespace common
