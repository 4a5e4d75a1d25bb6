/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "scheduler.hpp"

namespace prefs::se {

  /**
   * Routes tasks to execution contexts. A context is addressed by its Tid,
   * one per DeliveryContext.
   */
  struct Dispatcher {
    using Tid = uint32_t;
    using Task = IScheduler::Task;

    virtual ~Dispatcher() = default;

    virtual void dispose() = 0;

    /// @return false if no context is known under @p tid or the dispatcher
    /// has been disposed
    virtual bool add(Tid tid, Task &&task) = 0;
  };

}  // namespace prefs::se
