#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <random>
#include <thread>

#include "tessera/upload/thread_pool.hpp"

using namespace std::chrono_literals;

namespace {

TEST(ThreadPoolStress, ChurnAndWaitAll) {
  using tessera::upload::ThreadPool;

  const std::size_t nt = std::max(2u, std::thread::hardware_concurrency() / 2);
  ThreadPool pool(nt);

  std::mutex rng_mu;
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> dist(0, 9);

  std::atomic<std::uint64_t> planned{0};
  std::atomic<std::uint64_t> executed{0};

  auto work = [&](auto&& self, int depth) -> void {
    executed.fetch_add(1, std::memory_order_relaxed);
    volatile float acc = 0.f;
    for (int i = 0; i < 128; ++i) acc += (i * 0.5f);
    (void)acc;

    if (depth < 3) {
      int roll;
      { std::lock_guard lk(rng_mu); roll = dist(rng); }
      if (roll == 0) { // ~10% chance to spawn
        planned.fetch_add(1, std::memory_order_relaxed);
        auto r = pool.execute([&self, depth] { self(self, depth + 1); });
        ASSERT_TRUE(r.has_value());
      }
    }
  };

  constexpr int rounds = 3;
  constexpr int base_tasks = 2000;
  for (int r = 0; r < rounds; ++r) {
    planned.store(0, std::memory_order_relaxed);
    executed.store(0, std::memory_order_relaxed);

    planned.fetch_add(base_tasks, std::memory_order_relaxed);
    for (int i = 0; i < base_tasks; ++i) {
      (void)pool.submit([&work] { work(work, 0); });
    }

    // spawned tasks are enqueued before their parent finishes, so one wait suffices
    pool.wait_all();
    EXPECT_EQ(executed.load(), planned.load()) << "Round " << r << " mismatch";
  }
}

TEST(ThreadPoolStress, ManyFuturesMix) {
  using tessera::upload::ThreadPool;

  ThreadPool pool(std::max(2u, std::thread::hardware_concurrency() / 2));

  constexpr int N = 1000;
  std::vector<std::future<void>> futs;
  futs.reserve(N);

  std::atomic<int> acc{0};
  for (int i = 0; i < N; ++i) {
    futs.emplace_back(pool.submit([&acc] { acc.fetch_add(1, std::memory_order_relaxed); }));
  }
  for (int i = 0; i < N; ++i) {
    ASSERT_TRUE(pool.execute([&acc] { acc.fetch_add(1, std::memory_order_relaxed); }).has_value());
  }

  for (auto& f : futs) f.wait();
  pool.wait_all();

  EXPECT_EQ(acc.load(), 2 * N);
}

TEST(ThreadPoolStress, SingleWorkerRunsInSubmissionOrder) {
  tessera::upload::ThreadPool pool(1);
  ASSERT_EQ(pool.num_threads(), 1u);

  std::vector<int> order;
  for (int i = 0; i < 100; ++i) {
    ASSERT_TRUE(pool.execute([&order, i] { order.push_back(i); }).has_value());
  }
  pool.wait_all();
  ASSERT_EQ(order.size(), 100u);
  for (int i = 0; i < 100; ++i) EXPECT_EQ(order[i], i);
}

TEST(ThreadPoolStress, StoppedPoolRejectsWork) {
  tessera::upload::ThreadPool pool(2);
  std::atomic<int> ran{0};
  ASSERT_TRUE(pool.execute([&ran] { ran.fetch_add(1); }).has_value());
  pool.wait_all();
  pool.request_stop();
  EXPECT_TRUE(pool.stopping());

  auto r = pool.execute([&ran] { ran.fetch_add(1); });
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, tessera::core::error_code::unavailable);
  EXPECT_THROW((void)pool.submit([] {}), std::runtime_error);
  EXPECT_EQ(ran.load(), 1);
}

TEST(ThreadPoolStress, DestructorDrainsAcceptedTasks) {
  std::atomic<int> ran{0};
  {
    tessera::upload::ThreadPool pool(2);
    for (int i = 0; i < 200; ++i) {
      ASSERT_TRUE(pool.execute([&ran] {
        std::this_thread::sleep_for(50us);
        ran.fetch_add(1);
      }).has_value());
    }
  }
  EXPECT_EQ(ran.load(), 200);
}

} // namespace
