/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string_view>

#include <qtils/outcome.hpp>

#include "store/value.hpp"

namespace prefs {

  /**
   * Receiver of a store's native per-key change notifications.
   */
  class KeyObserver {
   public:
    virtual ~KeyObserver() = default;

    /**
     * Called by the store whenever the effective value of an observed key
     * changes. May be invoked on any thread, usually the writer's.
     * @param key key the notification is about
     * @param old_value effective value before the change
     * @param new_value effective value after the change
     */
    virtual void onKeyChanged(std::string_view key,
                              const OptValue &old_value,
                              const OptValue &new_value) = 0;
  };

  /**
   * @brief Key-value store capability the settings layer works against.
   *
   * The effective value of a key is the value written by the user, or the
   * registered default when nothing has been written. Identity of a store is
   * the identity of its shared instance.
   */
  class Store {
   public:
    virtual ~Store() = default;

    [[nodiscard]] virtual OptValue read(std::string_view key) const = 0;

    virtual outcome::result<void> write(std::string_view key, Value value) = 0;

    /// Removes the user value; the key falls back to its default, if any
    virtual outcome::result<void> remove(std::string_view key) = 0;

    virtual void registerDefaults(const Dictionary &defaults) = 0;

    /// Effective values of all keys that have a user value or a default
    [[nodiscard]] virtual Dictionary dictionaryRepresentation() const = 0;

    /**
     * Native observation facility. The store keeps only a weak reference to
     * @p observer; an expired observer is skipped and pruned.
     * @return effective value of @p key at the moment of registration
     */
    virtual outcome::result<OptValue> addObserver(
        std::string_view key, std::weak_ptr<KeyObserver> observer) = 0;

    /// Idempotent; unknown registrations are ignored
    virtual void removeObserver(std::string_view key,
                                const KeyObserver &observer) = 0;
  };

}  // namespace prefs
