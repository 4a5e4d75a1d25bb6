/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <qtils/outcome.hpp>

#include "log/logger.hpp"
#include "observation/cancellable.hpp"
#include "se/impl/common.hpp"
#include "store/store.hpp"

namespace prefs::observation {

  using ChangeCallback =
      std::function<void(const OptValue &old_value, const OptValue &new_value)>;

  /**
   * @brief Observation of a single key of a store.
   *
   * Registers with the store's native notification facility on creation and
   * forwards every change of the key as (old, new) to the callback. The
   * first call happens during creation and carries the current value as both
   * old and new. Changes notified while that first call is pending are held
   * back and forwarded after it, in the order they arrived.
   *
   * The callback runs on whichever thread the store notifies from and is not
   * serialized against `cancel()`: a delivery that has already started when
   * `cancel()` is called may still complete.
   *
   * Only a weak reference to the store is held, and it is cleared on
   * cancellation. Cancellation happens at most once, either explicitly or
   * on destruction.
   */
  class KeyObservation final
      : public KeyObserver,
        public Cancellable,
        public std::enable_shared_from_this<KeyObservation> {
   public:
    static outcome::result<std::shared_ptr<KeyObservation>> create(
        const std::shared_ptr<Store> &store,
        std::string key,
        ChangeCallback callback,
        log::Logger logger);

    ~KeyObservation() override;

    void onKeyChanged(std::string_view key,
                      const OptValue &old_value,
                      const OptValue &new_value) override;

    void cancel() override;

    [[nodiscard]] bool isCancelled() const;

    const std::string &key() const {
      return key_;
    }

   private:
    KeyObservation(std::weak_ptr<Store> store,
                   std::string key,
                   ChangeCallback callback,
                   log::Logger logger);

    using Change = std::pair<OptValue, OptValue>;

    /// Changes received before the initial value was delivered
    struct Backlog {
      bool flushed = false;
      std::deque<Change> changes;
    };

    /// Delivers @p current, then the backlog, then opens direct delivery
    void deliverInitial(const OptValue &current);

    mutable se::utils::SafeObject<std::weak_ptr<Store>, std::mutex> store_;
    se::utils::SafeObject<Backlog, std::mutex> backlog_;
    const std::string key_;
    const ChangeCallback callback_;
    log::Logger logger_;
  };

  /**
   * Observes @p key of @p store.
   * @return handle that keeps the observation alive; dropping it cancels
   */
  outcome::result<CancelHandle> observe(const std::shared_ptr<Store> &store,
                                        std::string key,
                                        ChangeCallback callback,
                                        log::Logger logger);

}  // namespace prefs::observation
