/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

#include "se/delivery_context.hpp"
#include "se/impl/async_dispatcher_impl.hpp"

using namespace std::chrono_literals;
using prefs::DeliveryContext;
using prefs::kDeliveryContextsCount;
using prefs::toTid;
using prefs::se::AsyncDispatcher;

TEST(AsyncDispatcherTest, RunsTasksInPostingOrder) {
  AsyncDispatcher<kDeliveryContextsCount> dispatcher;
  std::mutex mutex;
  std::vector<int> order;
  std::promise<void> finished;

  for (int i = 0; i < 100; ++i) {
    ASSERT_TRUE(dispatcher.add(toTid(DeliveryContext::kMain), [&, i] {
      std::lock_guard lock(mutex);
      order.push_back(i);
    }));
  }
  ASSERT_TRUE(dispatcher.add(toTid(DeliveryContext::kMain),
                             [&] { finished.set_value(); }));
  ASSERT_EQ(finished.get_future().wait_for(2s), std::future_status::ready);

  std::lock_guard lock(mutex);
  ASSERT_EQ(order.size(), 100u);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(order[i], i);
  }
}

TEST(AsyncDispatcherTest, TasksRunOffThePostingThread) {
  AsyncDispatcher<kDeliveryContextsCount> dispatcher;
  std::promise<std::thread::id> ran_on;
  ASSERT_TRUE(dispatcher.add(toTid(DeliveryContext::kMain), [&] {
    ran_on.set_value(std::this_thread::get_id());
  }));
  auto future = ran_on.get_future();
  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_NE(future.get(), std::this_thread::get_id());
}

TEST(AsyncDispatcherTest, RejectsUnknownContextAndDisposedDispatcher) {
  AsyncDispatcher<kDeliveryContextsCount> dispatcher;
  EXPECT_FALSE(dispatcher.add(kDeliveryContextsCount + 5, [] {}));

  dispatcher.dispose();
  EXPECT_FALSE(dispatcher.add(toTid(DeliveryContext::kMain), [] {}));
}

TEST(GetDispatcherTest, MainContextIsServed) {
  auto dispatcher = prefs::se::getDispatcher();
  std::promise<void> ran;
  ASSERT_TRUE(dispatcher->add(toTid(DeliveryContext::kMain),
                              [&] { ran.set_value(); }));
  EXPECT_EQ(ran.get_future().wait_for(2s), std::future_status::ready);
  dispatcher->dispose();
}
