#include "common/thread_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <vector>

namespace common {
namespace {

TEST(ThreadPoolTest, RunsTasksAndReturnsResults) {
  ThreadPool pool(2, "test");
  auto sum = pool.commit([](int a, int b) { return a + b; }, 2, 3);
  EXPECT_EQ(sum.get(), 5);
  EXPECT_EQ(pool.size(), 2u);
}

TEST(ThreadPoolTest, NeverRunsMoreTasksThanThreads) {
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  std::vector<std::future<void>> done;
  {
    ThreadPool pool(3, "bounded");
    for (int i = 0; i < 12; ++i) {
      done.push_back(pool.commit([&]() {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --running;
      }));
    }
    for (auto& f : done) f.get();
  }
  EXPECT_LE(peak.load(), 3);
  EXPECT_GE(peak.load(), 1);
}

TEST(ThreadPoolTest, DestructorDrainsQueuedTasks) {
  std::atomic<int> executed{0};
  {
    ThreadPool pool(1, "drain");
    for (int i = 0; i < 10; ++i) {
      pool.commit([&]() { ++executed; });
    }
  }
  EXPECT_EQ(executed.load(), 10);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
  ThreadPool pool(1, "throws");
  auto failing = pool.commit([]() -> int { throw std::runtime_error("boom"); });
  EXPECT_THROW(failing.get(), std::runtime_error);
}

} // namespace
} // namespace common
