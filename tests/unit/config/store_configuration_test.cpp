/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/store_configuration.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "store/in_memory/in_memory_store.hpp"

using prefs::InMemoryStore;
using prefs::Store;
using prefs::config::StoreConfiguration;

TEST(StoreConfigurationTest, FallsBackToStandardStore) {
  StoreConfiguration configuration;
  std::shared_ptr<Store> standard = InMemoryStore::standard();
  EXPECT_EQ(configuration.store(), standard);
  EXPECT_EQ(configuration.prefix(), "");
}

TEST(StoreConfigurationTest, ConfigureReplacesStoreAndPrefix) {
  StoreConfiguration configuration;
  auto store = std::make_shared<InMemoryStore>();
  configuration.configure(store, "app_");

  std::shared_ptr<Store> expected = store;
  EXPECT_EQ(configuration.store(), expected);
  EXPECT_EQ(configuration.prefix(), "app_");

  configuration.configure(nullptr);
  EXPECT_EQ(configuration.store(),
            std::shared_ptr<Store>(InMemoryStore::standard()));
  EXPECT_EQ(configuration.prefix(), "");
}

TEST(StoreConfigurationTest, SnapshotIsNeverTorn) {
  auto a = std::make_shared<InMemoryStore>();
  auto b = std::make_shared<InMemoryStore>();
  StoreConfiguration configuration(a, "a_");

  std::atomic_bool done = false;
  std::thread writer([&] {
    for (int i = 0; not done; ++i) {
      if (i % 2 == 0) {
        configuration.configure(b, "b_");
      } else {
        configuration.configure(a, "a_");
      }
    }
  });

  for (int i = 0; i < 10000; ++i) {
    auto [store, prefix] = configuration.snapshot();
    if (store == std::shared_ptr<Store>(a)) {
      ASSERT_EQ(prefix, "a_");
    } else {
      ASSERT_EQ(prefix, "b_");
    }
  }
  done = true;
  writer.join();
}
