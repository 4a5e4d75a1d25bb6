/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "se/impl/common.hpp"
#include "store/store.hpp"

namespace prefs::settings {

  /**
   * Remembers for which store the default of each key has been registered,
   * so registration happens once per key and store. A store that was
   * released and replaced gets its defaults again.
   */
  class DefaultRegistrar {
   public:
    /// @return true exactly once per (@p key, @p store) pair; the caller
    /// then registers the default
    bool markRegistered(const std::string &key,
                        const std::shared_ptr<Store> &store) {
      return registered_.exclusiveAccess([&](Registry &registry) {
        auto &registered_for = registry[key];
        if (not registered_for.expired()
            and registered_for.lock() == store) {
          return false;
        }
        registered_for = store;
        return true;
      });
    }

    /// Forgets all registrations
    void reset() {
      registered_.exclusiveAccess([](Registry &registry) { registry.clear(); });
    }

   private:
    using Registry = std::unordered_map<std::string, std::weak_ptr<Store>>;

    se::utils::SafeObject<Registry, std::mutex> registered_;
  };

}  // namespace prefs::settings
