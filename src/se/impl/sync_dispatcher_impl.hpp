/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>

#include "dispatcher.hpp"
#include "utils/ctor_limiters.hpp"

namespace prefs::se {

  /// Runs every task inline on the posting thread.
  template <uint32_t kCount>
  class SyncDispatcher final : public Dispatcher, NonCopyable, NonMovable {
   public:
    static constexpr uint32_t kHandlersCount = kCount;

    SyncDispatcher() = default;

    void dispose() override {
      is_disposed_ = true;
    }

    bool add(Tid tid, Task &&task) override {
      if (is_disposed_.load() or tid >= kHandlersCount) {
        return false;
      }
      task();
      return true;
    }

   private:
    std::atomic<bool> is_disposed_ = false;
  };

}  // namespace prefs::se
