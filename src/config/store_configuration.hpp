/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "se/impl/common.hpp"
#include "store/store.hpp"

namespace prefs::config {

  /**
   * @brief Which store settings live in, and under which key prefix.
   *
   * Shared by everything that reads settings; may be reconfigured at any
   * time (e.g. to swap in a test double). Reads and writes are serialized,
   * so a reader never sees a store from one configuration and a prefix
   * from another.
   */
  class StoreConfiguration {
   public:
    StoreConfiguration() = default;
    StoreConfiguration(std::shared_ptr<Store> store, std::string prefix);

    void configure(std::shared_ptr<Store> store, std::string prefix = {});

    /// Configured store, or the process default in-memory store when none
    /// has been configured
    std::shared_ptr<Store> store() const;

    std::string prefix() const;

    struct Snapshot {
      std::shared_ptr<Store> store;
      std::string prefix;
    };

    /// Store and prefix taken together
    Snapshot snapshot() const;

   private:
    struct State {
      std::shared_ptr<Store> store;
      std::string prefix;
    };

    mutable se::utils::SafeObject<State, std::mutex> state_;
  };

}  // namespace prefs::config
