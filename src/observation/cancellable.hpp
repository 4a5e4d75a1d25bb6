/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <utility>

#include "utils/ctor_limiters.hpp"

namespace prefs {

  /**
   * Something that can be stopped. Implementations make `cancel` idempotent
   * and safe to call from any thread.
   */
  class Cancellable {
   public:
    virtual ~Cancellable() = default;

    virtual void cancel() = 0;
  };

  /**
   * Owning handle of one active registration. Cancels it when destroyed or
   * reassigned, so a registration is never leaked.
   */
  class CancelHandle final : NonCopyable {
   public:
    CancelHandle() = default;

    explicit CancelHandle(std::shared_ptr<Cancellable> cancellable)
        : cancellable_(std::move(cancellable)) {}

    CancelHandle(CancelHandle &&other) noexcept
        : cancellable_(std::exchange(other.cancellable_, nullptr)) {}

    CancelHandle &operator=(CancelHandle &&other) noexcept {
      if (this != &other) {
        cancel();
        cancellable_ = std::exchange(other.cancellable_, nullptr);
      }
      return *this;
    }

    ~CancelHandle() {
      cancel();
    }

    /// Cancels the registration and releases it. Further calls do nothing.
    void cancel() {
      if (auto cancellable = std::exchange(cancellable_, nullptr)) {
        cancellable->cancel();
      }
    }

    explicit operator bool() const {
      return cancellable_ != nullptr;
    }

   private:
    std::shared_ptr<Cancellable> cancellable_;
  };

}  // namespace prefs
