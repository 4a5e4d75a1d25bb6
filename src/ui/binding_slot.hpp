/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <utility>

namespace prefs::ui {

  /**
   * @brief Value shown by one UI element.
   *
   * Every `set` bumps the version, so a view can tell it needs to be
   * redrawn. `waitVersion` blocks until a given version is reached.
   */
  template <typename T>
  class BindingSlot {
   public:
    BindingSlot() = default;
    explicit BindingSlot(T initial) : value_(std::move(initial)) {}

    T get() const {
      std::lock_guard lock(mutex_);
      return value_;
    }

    void set(T value) {
      {
        std::lock_guard lock(mutex_);
        value_ = std::move(value);
        ++version_;
      }
      cv_.notify_all();
    }

    uint64_t version() const {
      std::lock_guard lock(mutex_);
      return version_;
    }

    /// @return false if @p version was not reached within @p timeout
    bool waitVersion(uint64_t version,
                     std::chrono::milliseconds timeout) const {
      std::unique_lock lock(mutex_);
      return cv_.wait_for(
          lock, timeout, [&] { return version_ >= version; });
    }

   private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    T value_{};
    uint64_t version_ = 0;
  };

}  // namespace prefs::ui
