/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <memory>

#include "impl/dispatcher.hpp"

namespace prefs {
  /// Execution contexts values are delivered on.
  enum class DeliveryContext : uint32_t {
    /// Context of the UI thread; bound values are only touched from here
    kMain = 0,
    //---------------
    kTotalCount
  };

  static constexpr uint32_t kDeliveryContextsCount =
      static_cast<uint32_t>(DeliveryContext::kTotalCount);

  inline se::Dispatcher::Tid toTid(DeliveryContext context) {
    return static_cast<se::Dispatcher::Tid>(context);
  }
}  // namespace prefs

namespace prefs::se {
  /**
   * @brief Obtain a dispatcher with one context per DeliveryContext.
   *
   * Which implementation is returned is decided at link time: `se_async`
   * gives worker threads, `se_sync` executes inline on the posting thread.
   */
  std::shared_ptr<Dispatcher> getDispatcher();
}  // namespace prefs::se
