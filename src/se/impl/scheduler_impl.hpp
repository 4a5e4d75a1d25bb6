/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

#include "scheduler.hpp"
#include "utils/ctor_limiters.hpp"

namespace prefs::se {

  /**
   * Queue part of a scheduler. The owner supplies the executing thread and
   * runs `process()` on it until `dispose()` is called.
   */
  class SchedulerBase : public IScheduler, NonCopyable, NonMovable {
   private:
    std::deque<Task> tasks_;
    std::mutex tasks_cs_;
    std::condition_variable event_;
    bool proceed_ = true;

   public:
    void process() {
      std::unique_lock lock(tasks_cs_);
      while (proceed_) {
        if (tasks_.empty()) {
          event_.wait(lock);
          continue;
        }

        auto task = std::move(tasks_.front());
        tasks_.pop_front();

        lock.unlock();
        task();
        lock.lock();
      }
    }

    void dispose() override {
      {
        std::unique_lock lock(tasks_cs_);
        proceed_ = false;
        tasks_.clear();
      }
      event_.notify_all();
    }

    void add(Task &&t) override {
      {
        std::unique_lock lock(tasks_cs_);
        if (not proceed_) {
          return;
        }
        tasks_.emplace_back(std::move(t));
      }
      event_.notify_one();
    }
  };

}  // namespace prefs::se
