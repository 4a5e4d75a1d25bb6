/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <utility>

#include "bridge/completion.hpp"
#include "bridge/subscription.hpp"

namespace prefs::bridge {

  /**
   * Downstream consumer of a publisher. Gets the subscription first, then
   * values in order, then at most one completion.
   */
  template <typename T>
  class Subscriber {
   public:
    using Input = T;

    virtual ~Subscriber() = default;

    virtual void receiveSubscription(
        std::shared_ptr<Subscription> subscription) = 0;

    virtual void receive(const T &value) = 0;

    virtual void receiveCompletion(const Completion &completion) = 0;
  };

  /// Subscriber made of two callbacks
  template <typename T>
  class Sink final : public Subscriber<T> {
   public:
    using ValueHandler = std::function<void(const T &)>;
    using CompletionHandler = std::function<void(const Completion &)>;

    Sink(ValueHandler on_value, CompletionHandler on_completion)
        : on_value_(std::move(on_value)),
          on_completion_(std::move(on_completion)) {}

    void receiveSubscription(std::shared_ptr<Subscription>) override {}

    void receive(const T &value) override {
      if (on_value_) {
        on_value_(value);
      }
    }

    void receiveCompletion(const Completion &completion) override {
      if (on_completion_) {
        on_completion_(completion);
      }
    }

   private:
    ValueHandler on_value_;
    CompletionHandler on_completion_;
  };

  template <typename T>
  std::shared_ptr<Sink<T>> makeSink(
      typename Sink<T>::ValueHandler on_value,
      typename Sink<T>::CompletionHandler on_completion = nullptr) {
    return std::make_shared<Sink<T>>(std::move(on_value),
                                     std::move(on_completion));
  }

}  // namespace prefs::bridge
