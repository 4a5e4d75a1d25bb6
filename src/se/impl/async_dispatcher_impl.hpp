/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>

#include "dispatcher.hpp"
#include "thread_handler.hpp"
#include "utils/ctor_limiters.hpp"

namespace prefs::se {

  /**
   * Dispatcher with one worker thread per context. Each context is a serial
   * queue, so tasks posted to the same Tid never overlap and run in posting
   * order.
   */
  template <uint32_t kCount>
  class AsyncDispatcher final : public Dispatcher, NonCopyable, NonMovable {
   public:
    static constexpr uint32_t kHandlersCount = kCount;

   private:
    std::shared_ptr<ThreadHandler> handlers_[kHandlersCount];
    std::atomic<bool> is_disposed_ = false;

   public:
    AsyncDispatcher() {
      for (auto &h : handlers_) {
        h = std::make_shared<ThreadHandler>();
      }
    }

    ~AsyncDispatcher() override {
      dispose();
    }

    void dispose() override {
      if (is_disposed_.exchange(true)) {
        return;
      }
      for (auto &h : handlers_) {
        h->dispose();
      }
    }

    bool add(Tid tid, Task &&task) override {
      if (is_disposed_.load() or tid >= kHandlersCount) {
        return false;
      }
      handlers_[tid]->add(std::move(task));
      return true;
    }
  };

}  // namespace prefs::se
