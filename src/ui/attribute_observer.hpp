/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <utility>

#include "bridge/subscriber.hpp"
#include "log/logger.hpp"
#include "settings/container.hpp"
#include "ui/binding_slot.hpp"
#include "utils/ctor_limiters.hpp"

namespace prefs::ui {

  /**
   * @brief Keeps one UI slot in sync with one attribute.
   *
   * Holds at most one live subscription. `observe` may be called on every
   * refresh: it does nothing while the subscription was made against the
   * currently configured store, and replaces it when the store changed.
   * The old subscription is cancelled before the new one is made, so the
   * slot never follows two stores at once.
   */
  template <settings::AnyAttribute A>
  class AttributeObserver final : NonCopyable, NonMovable {
   public:
    using ValueType = typename A::ValueType;
    using Slot = BindingSlot<ValueType>;

    AttributeObserver(std::shared_ptr<settings::Container> container,
                      A attr,
                      log::Logger logger)
        : container_(std::move(container)),
          attr_(std::move(attr)),
          logger_(std::move(logger)) {}

    ~AttributeObserver() {
      cancel();
    }

    void observe(const std::shared_ptr<Slot> &slot) {
      auto store = container_->store();
      std::shared_ptr<bridge::Subscription> replaced;
      {
        std::lock_guard lock(mutex_);
        if (subscription_ and store_.lock() == store) {
          return;
        }
        replaced = std::exchange(subscription_, nullptr);
        store_.reset();
      }
      // cancelled without the lock: it waits for a running delivery
      if (replaced) {
        SL_DEBUG(logger_,
                 "Store of '{}' changed; resubscribing",
                 container_->key(attr_));
        replaced->cancel();
      }

      auto publisher = container_->publisher(attr_);
      auto updater = std::make_shared<SlotUpdater>(slot, container_, attr_);
      auto subscription = publisher.subscribe(std::move(updater));
      {
        std::lock_guard lock(mutex_);
        if (not subscription_) {
          subscription_ = std::exchange(subscription, nullptr);
          store_ = store;
        }
      }
      if (subscription) {
        // a concurrent observe has already subscribed
        subscription->cancel();
        return;
      }
      SL_TRACE(logger_, "Subscribed to '{}'", container_->key(attr_));
    }

    /// Releases the subscription, if any
    void cancel() {
      std::shared_ptr<bridge::Subscription> subscription;
      {
        std::lock_guard lock(mutex_);
        subscription = std::exchange(subscription_, nullptr);
        store_.reset();
      }
      if (subscription) {
        subscription->cancel();
      }
    }

    bool isSubscribed() const {
      std::lock_guard lock(mutex_);
      return subscription_ != nullptr;
    }

    /// Store the live subscription was made against
    std::shared_ptr<Store> subscribedStore() const {
      std::lock_guard lock(mutex_);
      return subscription_ ? store_.lock() : nullptr;
    }

   private:
    /// Writes delivered values into the slot. A failed stream is replaced
    /// by a direct read, so the slot is not left stale.
    class SlotUpdater final : public bridge::Subscriber<ValueType> {
     public:
      SlotUpdater(std::shared_ptr<Slot> slot,
                  std::shared_ptr<settings::Container> container,
                  A attr)
          : slot_(std::move(slot)),
            container_(std::move(container)),
            attr_(std::move(attr)) {}

      void receiveSubscription(
          std::shared_ptr<bridge::Subscription>) override {}

      void receive(const ValueType &value) override {
        slot_->set(value);
      }

      void receiveCompletion(const bridge::Completion &completion) override {
        if (not completion.isFinished()) {
          slot_->set(container_->read(attr_));
        }
      }

     private:
      std::shared_ptr<Slot> slot_;
      std::shared_ptr<settings::Container> container_;
      A attr_;
    };

    std::shared_ptr<settings::Container> container_;
    const A attr_;
    log::Logger logger_;

    mutable std::mutex mutex_;
    std::shared_ptr<bridge::Subscription> subscription_;
    std::weak_ptr<Store> store_;
  };

}  // namespace prefs::ui
