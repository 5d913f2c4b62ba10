#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>
#include "store/stripe_lock.hpp"

using namespace objstore::store;

TEST(StripeLockTest, HashIsLeadingSha256Bytes) {
  // SHA-256("abc") = ba7816bf...
  EXPECT_EQ(StripeLockManager::hash("abc"), 0xba7816bfu);
  // SHA-256("") = e3b0c442...
  EXPECT_EQ(StripeLockManager::hash(""), 0xe3b0c442u);
}

TEST(StripeLockTest, StripeIsStableAndInRange) {
  StripeLockManager stripes(100);
  EXPECT_EQ(stripes.size(), 100u);

  for (int i = 0; i < 500; ++i) {
    const std::string bucket = "bucket-" + std::to_string(i);
    const auto stripe = stripes.stripe_for(bucket);
    EXPECT_LT(stripe, 100u);
    EXPECT_EQ(stripe, stripes.stripe_for(bucket));
    EXPECT_EQ(stripe, StripeLockManager::hash(bucket) % 100);
  }
}

TEST(StripeLockTest, BucketsSpreadOverStripes) {
  StripeLockManager stripes(16);
  std::set<std::uint32_t> used;
  for (int i = 0; i < 200; ++i) {
    used.insert(stripes.stripe_for("b" + std::to_string(i)));
  }
  EXPECT_GT(used.size(), 8u);
}

TEST(StripeLockTest, SingleStripeMapsEverythingToZero) {
  StripeLockManager stripes(1);
  EXPECT_EQ(stripes.stripe_for("a"), 0u);
  EXPECT_EQ(stripes.stripe_for("zzz"), 0u);
}

TEST(StripeLockTest, RejectsInvalidConfiguration) {
  EXPECT_THROW(StripeLockManager(0), std::invalid_argument);

  StripeLockManager stripes(4);
  EXPECT_NO_THROW(stripes.lock_for(3));
  EXPECT_THROW(stripes.lock_for(4), std::out_of_range);
}

TEST(StripeLockTest, SameStripeReturnsSameLock) {
  StripeLockManager stripes(8);
  EXPECT_EQ(&stripes.lock_for(2), &stripes.lock_for(2));
  EXPECT_NE(&stripes.lock_for(2), &stripes.lock_for(3));
}

TEST(StripeLockTest, ExclusiveLockSerializesWriters) {
  StripeLockManager stripes(2);
  std::shared_mutex& lock = stripes.lock_for(stripes.stripe_for("shared-bucket"));

  int counter = 0;
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 1000; ++i) {
        std::unique_lock<std::shared_mutex> guard(lock);
        ++counter;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(counter, 8000);
}

TEST(StripeLockTest, SharedLockAdmitsConcurrentReaders) {
  StripeLockManager stripes(1);
  std::shared_mutex& lock = stripes.lock_for(0);

  std::shared_lock<std::shared_mutex> first(lock);
  std::atomic<bool> acquired{false};
  std::thread reader([&]() {
    std::shared_lock<std::shared_mutex> second(lock);
    acquired = true;
  });
  reader.join();
  EXPECT_TRUE(acquired);
}
