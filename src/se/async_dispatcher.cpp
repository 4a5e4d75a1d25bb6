/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <memory>

#include "delivery_context.hpp"
#include "impl/async_dispatcher_impl.hpp"

namespace prefs::se {

  std::shared_ptr<Dispatcher> getDispatcher() {
    return std::make_shared<AsyncDispatcher<kDeliveryContextsCount>>();
  }

}  // namespace prefs::se
