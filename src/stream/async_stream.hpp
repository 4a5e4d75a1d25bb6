/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <system_error>
#include <utility>

#include <qtils/outcome.hpp>

#include "stream/stream_error.hpp"
#include "utils/ctor_limiters.hpp"

namespace prefs::stream {

  /**
   * @brief Unbounded single-consumer stream fed by a Continuation
   *
   * The producer side (Continuation) pushes elements and eventually finishes
   * the stream, normally or with an error. The consumer pulls elements with
   * `next`. Elements buffered before finishing are still delivered, the
   * error (if any) comes after them.
   *
   * The termination handler runs exactly once: when the producer finishes,
   * when a wait in `next` is stopped, or when the stream itself is destroyed,
   * whichever happens first. It runs without any internal lock held.
   *
   * @tparam T element type
   */
  template <typename T>
  class AsyncStream final : NonCopyable {
    struct State {
      std::mutex mutex;
      std::condition_variable_any cv;
      std::deque<T> buffer;
      std::optional<std::error_code> failure;
      bool finished = false;
      bool terminated = false;
      std::function<void()> on_termination;

      /// Marks the stream as terminated and returns the handler to run
      std::function<void()> terminate(std::unique_lock<std::mutex> &lock) {
        std::function<void()> handler;
        if (not terminated) {
          terminated = true;
          handler = std::move(on_termination);
          on_termination = nullptr;
        }
        lock.unlock();
        cv.notify_all();
        return handler;
      }

      void terminate() {
        std::unique_lock lock(mutex);
        if (auto handler = terminate(lock)) {
          handler();
        }
      }
    };

   public:
    using Element = T;

    /**
     * @brief Producer side of an AsyncStream
     *
     * Copyable; all copies feed the same stream. Calls after the stream has
     * terminated are ignored.
     */
    class Continuation {
     public:
      /// Appends @p value to the stream
      void yield(T value) const {
        std::unique_lock lock(state_->mutex);
        if (state_->terminated) {
          return;
        }
        state_->buffer.emplace_back(std::move(value));
        lock.unlock();
        state_->cv.notify_all();
      }

      /// Finishes the stream normally
      void finish() const {
        finishWith(std::nullopt);
      }

      /// Finishes the stream with @p error
      void finish(std::error_code error) const {
        finishWith(error);
      }

      /**
       * Sets the handler to be run once the stream terminates. If it already
       * has, @p handler runs immediately.
       */
      void onTermination(std::function<void()> handler) const {
        std::unique_lock lock(state_->mutex);
        if (state_->terminated) {
          lock.unlock();
          if (handler) {
            handler();
          }
          return;
        }
        state_->on_termination = std::move(handler);
      }

      bool isTerminated() const {
        std::lock_guard lock(state_->mutex);
        return state_->terminated;
      }

     private:
      friend class AsyncStream;

      explicit Continuation(std::shared_ptr<State> state)
          : state_(std::move(state)) {}

      void finishWith(std::optional<std::error_code> error) const {
        std::unique_lock lock(state_->mutex);
        if (state_->terminated) {
          return;
        }
        state_->finished = true;
        state_->failure = error;
        if (auto handler = state_->terminate(lock)) {
          handler();
        }
      }

      std::shared_ptr<State> state_;
    };

    AsyncStream(AsyncStream &&other) noexcept
        : state_(std::exchange(other.state_, nullptr)) {}

    AsyncStream &operator=(AsyncStream &&other) noexcept {
      if (this != &other) {
        release();
        state_ = std::exchange(other.state_, nullptr);
      }
      return *this;
    }

    ~AsyncStream() {
      release();
    }

    /**
     * Waits for the next element.
     * @return the element; an empty optional once the stream finished
     * normally; the finishing error (once, then empty); or
     * StreamError::CANCELLED when @p stop was requested during the wait
     */
    outcome::result<std::optional<T>> next(std::stop_token stop) {
      if (not state_) {
        return std::optional<T>{};
      }
      std::unique_lock lock(state_->mutex);
      auto ready = state_->cv.wait(lock, stop, [&] {
        return not state_->buffer.empty() or state_->terminated;
      });
      if (not ready) {
        if (auto handler = state_->terminate(lock)) {
          handler();
        }
        return StreamError::CANCELLED;
      }
      if (not state_->buffer.empty()) {
        std::optional<T> value{std::in_place,
                               std::move(state_->buffer.front())};
        state_->buffer.pop_front();
        return value;
      }
      if (state_->failure) {
        auto error = *std::exchange(state_->failure, std::nullopt);
        return error;
      }
      return std::optional<T>{};
    }

    /// Creates a connected stream and continuation pair
    static std::pair<AsyncStream, Continuation> create() {
      auto state = std::make_shared<State>();
      Continuation continuation{state};
      return {AsyncStream{std::move(state)}, std::move(continuation)};
    }

   private:
    explicit AsyncStream(std::shared_ptr<State> state)
        : state_(std::move(state)) {}

    void release() {
      if (auto state = std::exchange(state_, nullptr)) {
        state->terminate();
      }
    }

    std::shared_ptr<State> state_;
  };

  template <typename T>
  std::pair<AsyncStream<T>, typename AsyncStream<T>::Continuation>
  makeStream() {
    return AsyncStream<T>::create();
  }

}  // namespace prefs::stream
