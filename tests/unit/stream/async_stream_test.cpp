/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stream/async_stream.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

#include <qtils/test/outcome.hpp>

#include "stream/distinct_map.hpp"
#include "testutil/injected_error.hpp"

using namespace std::chrono_literals;
using prefs::stream::makeStream;
using prefs::stream::StreamError;

TEST(AsyncStreamTest, BufferedElementsComeFirst) {
  auto [stream, continuation] = makeStream<int>();
  continuation.yield(1);
  continuation.yield(2);
  continuation.finish();
  continuation.yield(3);

  std::stop_source stop;
  ASSERT_OUTCOME_SUCCESS(first, stream.next(stop.get_token()));
  EXPECT_EQ(first, 1);
  ASSERT_OUTCOME_SUCCESS(second, stream.next(stop.get_token()));
  EXPECT_EQ(second, 2);
  ASSERT_OUTCOME_SUCCESS(end, stream.next(stop.get_token()));
  EXPECT_EQ(end, std::nullopt);
}

TEST(AsyncStreamTest, FailureFollowsBufferedElements) {
  auto [stream, continuation] = makeStream<int>();
  continuation.yield(1);
  continuation.finish(testutil::InjectedError::SOURCE_FAILED);

  std::stop_source stop;
  ASSERT_OUTCOME_SUCCESS(first, stream.next(stop.get_token()));
  EXPECT_EQ(first, 1);
  ASSERT_OUTCOME_ERROR(stream.next(stop.get_token()),
                       testutil::InjectedError::SOURCE_FAILED);
  ASSERT_OUTCOME_SUCCESS(end, stream.next(stop.get_token()));
  EXPECT_EQ(end, std::nullopt);
}

TEST(AsyncStreamTest, NextWaitsForProducer) {
  auto created = makeStream<int>();
  auto stream = std::move(created.first);
  std::thread producer([continuation = created.second] {
    std::this_thread::sleep_for(10ms);
    continuation.yield(7);
  });

  std::stop_source stop;
  ASSERT_OUTCOME_SUCCESS(value, stream.next(stop.get_token()));
  EXPECT_EQ(value, 7);
  producer.join();
}

TEST(AsyncStreamTest, StopWakesWaitingConsumer) {
  auto [stream, continuation] = makeStream<int>();
  int terminated = 0;
  continuation.onTermination([&] { ++terminated; });

  std::stop_source stop;
  std::thread stopper([&] {
    std::this_thread::sleep_for(10ms);
    stop.request_stop();
  });
  ASSERT_OUTCOME_ERROR(stream.next(stop.get_token()), StreamError::CANCELLED);
  stopper.join();

  EXPECT_EQ(terminated, 1);
  EXPECT_TRUE(continuation.isTerminated());
}

TEST(AsyncStreamTest, TerminationHandlerRunsOnce) {
  int terminated = 0;
  {
    auto [stream, continuation] = makeStream<int>();
    continuation.onTermination([&] { ++terminated; });
    continuation.finish();
    continuation.finish(testutil::InjectedError::SOURCE_FAILED);
  }
  EXPECT_EQ(terminated, 1);
}

TEST(AsyncStreamTest, DroppingStreamTerminates) {
  int terminated = 0;
  auto created = makeStream<int>();
  auto continuation = created.second;
  continuation.onTermination([&] { ++terminated; });
  {
    auto stream = std::move(created.first);
  }
  EXPECT_EQ(terminated, 1);
  EXPECT_TRUE(continuation.isTerminated());
}

TEST(AsyncStreamTest, HandlerSetAfterTerminationRunsImmediately) {
  auto [stream, continuation] = makeStream<int>();
  continuation.finish();
  bool ran = false;
  continuation.onTermination([&] { ran = true; });
  EXPECT_TRUE(ran);
}

TEST(DistinctMapTest, ProjectsAndDropsConsecutiveDuplicates) {
  auto [stream, continuation] = makeStream<int>();
  for (int v : {1, 3, 5, 4, 6, 7}) {
    continuation.yield(v);
  }
  continuation.finish();

  auto parity = prefs::stream::distinctMap(std::move(stream),
                                           [](int v) { return v % 2 == 0; });
  std::stop_source stop;
  std::vector<bool> seen;
  while (true) {
    ASSERT_OUTCOME_SUCCESS(item, parity.next(stop.get_token()));
    if (not item) {
      break;
    }
    seen.push_back(*item);
  }
  EXPECT_EQ(seen, (std::vector<bool>{false, true, false}));
}
