/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <string_view>
#include <thread>

#include <fmt/format.h>
#include <soralog/util.hpp>

#include "scheduler_impl.hpp"

namespace prefs::se {

  /// Scheduler with its own worker thread.
  class ThreadHandler final : public SchedulerBase {
   private:
    std::thread worker_;

   public:
    explicit ThreadHandler(std::string_view name = "delivery") {
      worker_ = std::thread(
          [](ThreadHandler *__this, std::string tname) {
            soralog::util::setThreadName(tname);
            return __this->process();
          },
          this,
          fmt::format("{}.{}", name, nextIndex()));
    }

    ~ThreadHandler() override {
      dispose();
    }

    /// Stops the queue and joins the worker; must not be called from one of
    /// its own tasks
    void dispose() override {
      SchedulerBase::dispose();
      if (worker_.joinable()) {
        worker_.join();
      }
    }

   private:
    static size_t nextIndex() {
      static std::atomic_size_t counter = 0;
      return ++counter;
    }
  };

}  // namespace prefs::se
