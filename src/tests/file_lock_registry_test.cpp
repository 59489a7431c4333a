#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "engine/file_lock_registry.hpp"
#include "test_utils.hpp"

using chunkvault::engine::FileLockRegistry;

class FileLockRegistryTest : public ::testing::Test {
protected:
  FileLockRegistry registry;

  static void SetUpTestSuite() {
    init_test_logging();
  }
};

TEST_F(FileLockRegistryTest, EntryLivesOnlyWhileHeld) {
  EXPECT_EQ(registry.active_entries(), 0u);
  {
    auto guard = registry.lock("alice", "file1");
    EXPECT_EQ(registry.active_entries(), 1u);
    auto other = registry.lock("alice", "file2");
    EXPECT_EQ(registry.active_entries(), 2u);
  }
  EXPECT_EQ(registry.active_entries(), 0u);
}

TEST_F(FileLockRegistryTest, GuardCanBeMoved) {
  auto make_guard = [this]() { return registry.lock("alice", "file1"); };
  {
    FileLockRegistry::Guard moved = make_guard();
    FileLockRegistry::Guard again(std::move(moved));
    EXPECT_EQ(registry.active_entries(), 1u);
  }
  EXPECT_EQ(registry.active_entries(), 0u);
}

TEST_F(FileLockRegistryTest, SameFileIsMutuallyExclusive) {
  const int num_threads = 4;
  const int iterations = 200;
  int counter = 0;
  std::atomic<int> inside{0};
  std::atomic<bool> overlap{false};
  std::vector<std::thread> threads;

  for (int i = 0; i < num_threads; ++i) {
    threads.emplace_back([&]() {
      for (int j = 0; j < iterations; ++j) {
        auto guard = registry.lock("alice", "shared");
        if (inside.fetch_add(1) != 0) {
          overlap = true;
        }
        ++counter;
        inside.fetch_sub(1);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_FALSE(overlap);
  EXPECT_EQ(counter, num_threads * iterations);
  EXPECT_EQ(registry.active_entries(), 0u);
}

TEST_F(FileLockRegistryTest, DifferentFilesDoNotBlock) {
  auto held = registry.lock("alice", "file1");
  std::atomic<bool> acquired{false};

  std::thread other([&]() {
    auto guard = registry.lock("alice", "file2");
    acquired = true;
  });
  other.join();
  EXPECT_TRUE(acquired);

  // Same id under another owner is a different file
  std::thread foreign([&]() {
    auto guard = registry.lock("bob", "file1");
  });
  foreign.join();
}

TEST_F(FileLockRegistryTest, WaiterProceedsAfterRelease) {
  std::atomic<bool> acquired{false};
  std::thread waiter;
  {
    auto held = registry.lock("alice", "file1");
    waiter = std::thread([&]() {
      auto guard = registry.lock("alice", "file1");
      acquired = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(acquired);
  }
  waiter.join();
  EXPECT_TRUE(acquired);
  EXPECT_EQ(registry.active_entries(), 0u);
}
