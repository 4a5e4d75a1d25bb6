/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>

#include "observation/cancellable.hpp"

namespace prefs::bridge {

  /**
   * Link between a publisher and its downstream. Cancelling it stops
   * delivery; `request` exists for downstreams that announce demand and has
   * no effect, values are pushed as soon as they are available.
   */
  class Subscription : public Cancellable {
   public:
    virtual void request(size_t demand) = 0;
  };

  /// Subscription of a downstream that was completed right away
  class InertSubscription final : public Subscription {
   public:
    void cancel() override {}
    void request(size_t) override {}
  };

}  // namespace prefs::bridge
