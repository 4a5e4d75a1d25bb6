/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "ui/attribute_observer.hpp"

namespace prefs::ui {

  /**
   * Binding of one attribute for a UI element. Starts with the value read
   * from the store; `update` (called on refresh) keeps it in sync
   * afterwards, and `set` writes through to the store.
   */
  template <settings::AnyAttribute A>
  class AppSetting {
   public:
    using ValueType = typename A::ValueType;

    AppSetting(std::shared_ptr<settings::Container> container,
               A attr,
               const qtils::SharedRef<log::LoggingSystem> &logsys)
        : container_(container),
          attr_(attr),
          slot_(std::make_shared<BindingSlot<ValueType>>(
              container_->read(attr_))),
          observer_(std::move(container),
                    std::move(attr),
                    logsys->getLogger("AttributeObserver", "ui")) {}

    ValueType value() const {
      return slot_->get();
    }

    outcome::result<void> set(const ValueType &value) {
      slot_->set(value);
      return container_->write(attr_, value);
    }

    void update() {
      observer_.observe(slot_);
    }

    const std::shared_ptr<BindingSlot<ValueType>> &slot() const {
      return slot_;
    }

    const AttributeObserver<A> &observer() const {
      return observer_;
    }

   private:
    std::shared_ptr<settings::Container> container_;
    const A attr_;
    std::shared_ptr<BindingSlot<ValueType>> slot_;
    AttributeObserver<A> observer_;
  };

}  // namespace prefs::ui
