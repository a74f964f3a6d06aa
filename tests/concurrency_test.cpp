#include "concurrency.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace meshlink {

class ConcurrentSetParamTest : public ::testing::TestWithParam<int> {};

TEST_P(ConcurrentSetParamTest, ConcurrentInsertsKeepEveryId) {
  const int num_threads = GetParam();
  constexpr int kPerThread = 1000;
  ConcurrentSet<int64_t> set;
  std::atomic<int> inserted{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&, t]() {
      // neighbouring threads overlap on half of their range
      const int64_t start = t * kPerThread / 2;
      for (int64_t i = start; i < start + kPerThread; ++i) {
        if (set.insert(i)) {
          inserted++;
        }
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  const int64_t expected = (num_threads - 1) * kPerThread / 2 + kPerThread;
  EXPECT_EQ(static_cast<int64_t>(set.size()), expected);
  EXPECT_EQ(inserted.load(), expected);

  auto sorted = set.sorted();
  ASSERT_EQ(static_cast<int64_t>(sorted.size()), expected);
  for (int64_t i = 0; i < expected; ++i) {
    ASSERT_EQ(sorted[i], i);
  }
}

INSTANTIATE_TEST_SUITE_P(ThreadCounts, ConcurrentSetParamTest,
                         ::testing::Values(1, 2, 4, 8));

TEST(ConcurrentSetTest, BasicOperations) {
  ConcurrentSet<int64_t> set;
  EXPECT_TRUE(set.empty());
  EXPECT_TRUE(set.insert(3));
  EXPECT_FALSE(set.insert(3));
  EXPECT_TRUE(set.contains(3));
  EXPECT_FALSE(set.contains(4));
  EXPECT_TRUE(set.remove(3));
  EXPECT_FALSE(set.remove(3));
  EXPECT_TRUE(set.empty());

  set.insert(1);
  set.insert(2);
  set.clear();
  EXPECT_EQ(set.size(), 0);
}

TEST(LockRegistryTest, SameKeySameMutex) {
  LockRegistry<int64_t> registry;
  auto a = registry.get(1);
  auto b = registry.get(1);
  auto c = registry.get(2);
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
  EXPECT_EQ(registry.size(), 2);
}

TEST(LockRegistryTest, SerializesWorkPerKey) {
  LockRegistry<int64_t> registry;
  std::atomic<int> inside{0};
  std::atomic<int> max_inside{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 20; ++i) {
        auto mutex = registry.get(42);
        std::lock_guard<std::mutex> guard(*mutex);
        int now = ++inside;
        int seen = max_inside.load();
        while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::microseconds(50));
        --inside;
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  EXPECT_EQ(max_inside.load(), 1);
}

}  // namespace meshlink
