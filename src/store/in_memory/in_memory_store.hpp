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
#include <vector>

#include "se/impl/common.hpp"
#include "store/store.hpp"

namespace prefs {

  /**
   * Store that keeps everything in memory. Serves as the process default
   * store when nothing else is configured, and as a test double.
   *
   * Observers are notified only when the effective value changes. Writes are
   * serialized together with their notifications, so observers see changes
   * of one key in the order they were made. Observers may write back to the
   * store from within a notification.
   */
  class InMemoryStore final : public Store {
   public:
    InMemoryStore() = default;
    explicit InMemoryStore(Dictionary values);
    ~InMemoryStore() override = default;

    /// Shared process-wide instance
    static std::shared_ptr<InMemoryStore> standard();

    [[nodiscard]] OptValue read(std::string_view key) const override;

    outcome::result<void> write(std::string_view key, Value value) override;

    outcome::result<void> remove(std::string_view key) override;

    void registerDefaults(const Dictionary &defaults) override;

    [[nodiscard]] Dictionary dictionaryRepresentation() const override;

    outcome::result<OptValue> addObserver(
        std::string_view key, std::weak_ptr<KeyObserver> observer) override;

    void removeObserver(std::string_view key,
                        const KeyObserver &observer) override;

    /// Drops all user values; defaults stay
    void reset();

    /// Drops user values and defaults
    void clear();

    /// Drops defaults; user values stay
    void unregisterDefaults();

    [[nodiscard]] size_t observersCount(std::string_view key) const;

   private:
    struct Registration {
      const KeyObserver *id;
      std::weak_ptr<KeyObserver> observer;
    };

    struct State {
      Dictionary values;
      Dictionary defaults;
      std::unordered_map<std::string, std::vector<Registration>> observers;

      OptValue effective(const std::string &key) const;
      std::vector<std::shared_ptr<KeyObserver>> liveObservers(
          const std::string &key);
    };

    struct Change {
      std::string key;
      OptValue old_value;
      OptValue new_value;
      std::vector<std::shared_ptr<KeyObserver>> observers;
    };

    /// Applies @p mutate to the state and notifies observers of every key
    /// whose effective value changed
    template <typename F>
    void modify(F &&mutate);

    std::recursive_mutex write_cs_;
    se::utils::SafeObject<State> state_;
  };

}  // namespace prefs
