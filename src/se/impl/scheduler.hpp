/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

namespace prefs::se {

  /// Serial task queue. Tasks run one at a time in submission order.
  class IScheduler {
   public:
    using Task = std::function<void()>;
    virtual ~IScheduler() = default;

    /// Stops sheduler work; pending tasks are dropped
    virtual void dispose() = 0;

    virtual void add(Task &&t) = 0;
  };

}  // namespace prefs::se
