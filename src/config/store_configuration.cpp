/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/store_configuration.hpp"

#include "store/in_memory/in_memory_store.hpp"

namespace prefs::config {

  StoreConfiguration::StoreConfiguration(std::shared_ptr<Store> store,
                                         std::string prefix)
      : state_(State{.store = std::move(store), .prefix = std::move(prefix)}) {}

  void StoreConfiguration::configure(std::shared_ptr<Store> store,
                                     std::string prefix) {
    state_.exclusiveAccess([&](State &state) {
      state.store = std::move(store);
      state.prefix = std::move(prefix);
    });
  }

  std::shared_ptr<Store> StoreConfiguration::store() const {
    return snapshot().store;
  }

  std::string StoreConfiguration::prefix() const {
    return state_.exclusiveAccess(
        [](const State &state) { return state.prefix; });
  }

  StoreConfiguration::Snapshot StoreConfiguration::snapshot() const {
    return state_.exclusiveAccess([](const State &state) {
      std::shared_ptr<Store> store = state.store;
      if (not store) {
        store = InMemoryStore::standard();
      }
      return Snapshot{.store = std::move(store), .prefix = state.prefix};
    });
  }

}  // namespace prefs::config
