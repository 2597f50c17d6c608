#include "maestro/core/lockfree_queue.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace maestro;

namespace {

constexpr int kProducers = 4;
constexpr int kItemsPerProducer = 1000;

}  // namespace

TEST(MpscRingTest, PushThenPop) {
  MpscRing<int> ring(64);

  EXPECT_FALSE(ring.ready());
  EXPECT_TRUE(ring.try_push(42));
  EXPECT_TRUE(ring.ready());

  auto value = ring.pop();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 42);
  EXPECT_FALSE(ring.pop().has_value());
  EXPECT_FALSE(ring.ready());
}

TEST(MpscRingTest, CapacityRoundsUpAndRejectsWhenFull) {
  MpscRing<int> ring(5);
  EXPECT_EQ(ring.capacity(), 8u);
  EXPECT_EQ(MpscRing<int>(0).capacity(), 2u);

  for (int i = 0; i < 8; ++i) {
    EXPECT_TRUE(ring.try_push(i));
  }
  EXPECT_FALSE(ring.try_push(8));

  auto value = ring.pop();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 0);
  EXPECT_TRUE(ring.try_push(8));
}

TEST(MpscRingTest, DrainIntoStopsAtLimit) {
  MpscRing<std::string> ring(16);
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(ring.try_push(std::to_string(i)));
  }

  std::vector<std::string> out;
  EXPECT_EQ(ring.drain_into(out, 4), 4u);
  EXPECT_EQ(ring.drain_into(out, 100), 6u);
  EXPECT_EQ(ring.drain_into(out, 100), 0u);

  ASSERT_EQ(out.size(), 10u);
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(out[i], std::to_string(i));
  }
}

TEST(MpscRingTest, WrapsAroundManyLaps) {
  MpscRing<int> ring(4);
  for (int i = 0; i < 100; ++i) {
    ASSERT_TRUE(ring.try_push(i));
    ASSERT_TRUE(ring.try_push(i + 1000));
    EXPECT_EQ(ring.pop().value_or(-1), i);
    EXPECT_EQ(ring.pop().value_or(-1), i + 1000);
  }
}

TEST(MpscRingTest, ConcurrentProducersSingleConsumer) {
  MpscRing<int> ring(256);
  test::SimpleBarrier start(kProducers);

  std::vector<std::jthread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&] {
      start.arrive_and_wait();
      for (int i = 1; i <= kItemsPerProducer; ++i) {
        while (!ring.try_push(i)) {
          std::this_thread::yield();
        }
      }
    });
  }

  long long sum = 0;
  int received = 0;
  std::vector<int> batch;
  while (received < kProducers * kItemsPerProducer) {
    batch.clear();
    if (ring.drain_into(batch, 32) == 0) {
      std::this_thread::yield();
      continue;
    }
    for (int v : batch) {
      sum += v;
    }
    received += static_cast<int>(batch.size());
  }
  producers.clear();

  EXPECT_EQ(sum, static_cast<long long>(kProducers) * kItemsPerProducer *
                     (kItemsPerProducer + 1) / 2);
  EXPECT_FALSE(ring.ready());
}
