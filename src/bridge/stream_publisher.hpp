/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <soralog/util.hpp>

#include "bridge/subscriber.hpp"
#include "log/logger.hpp"
#include "se/delivery_context.hpp"
#include "se/impl/common.hpp"
#include "stream/pull_sequence.hpp"
#include "stream/stream_error.hpp"

namespace prefs::bridge {

  /**
   * @brief Subscription that runs the pull loop of one StreamPublisher.
   *
   * The loop runs on its own thread, pulls elements from the source and
   * posts each of them to the main delivery context. The stop token is
   * checked after every element. A pull that is blocked when cancellation
   * is requested is woken up and ends the loop without a completion.
   *
   * The downstream is kept in a lock-guarded cell shared with the posted
   * deliveries. `cancel()` empties it under the lock, so once `cancel()`
   * returns no value and no completion reaches the downstream anymore.
   */
  template <stream::PullSequence Seq>
  class PullSubscription final : public Subscription {
   public:
    using Element = typename Seq::Element;
    using Downstream = std::shared_ptr<Subscriber<Element>>;

    PullSubscription(Downstream downstream,
                     std::shared_ptr<se::Dispatcher> dispatcher,
                     log::Logger logger)
        : downstream_(std::make_shared<DownstreamCell>(std::move(downstream))),
          dispatcher_(std::move(dispatcher)),
          logger_(std::move(logger)) {}

    ~PullSubscription() override {
      cancel();
      // released by a delivery running on the pull thread itself
      if (thread_.joinable()
          and thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
      }
    }

    /// Launches the pull loop; called once, right after construction
    void start(Seq source) {
      thread_ = std::jthread(
          [source{std::move(source)},
           downstream{downstream_},
           dispatcher{dispatcher_},
           logger{logger_}](std::stop_token stop) mutable {
            soralog::util::setThreadName("pull");
            pullLoop(source, stop, downstream, dispatcher, logger);
          });
    }

    void cancel() override {
      auto had_downstream = downstream_->exclusiveAccess(
          [](Downstream &downstream) {
            return std::exchange(downstream, nullptr) != nullptr;
          });
      if (had_downstream) {
        SL_TRACE(logger_, "Subscription cancelled");
      }
      thread_.request_stop();
    }

    void request(size_t) override {}

   private:
    using DownstreamCell =
        se::utils::SafeObject<Downstream, std::recursive_mutex>;

    static void pullLoop(Seq &source,
                         const std::stop_token &stop,
                         const std::shared_ptr<DownstreamCell> &downstream,
                         const std::shared_ptr<se::Dispatcher> &dispatcher,
                         const log::Logger &logger) {
      while (not stop.stop_requested()) {
        auto item = source.next(stop);
        if (item.has_error()) {
          if (item.error() == stream::StreamError::CANCELLED) {
            SL_TRACE(logger, "Pull loop cancelled");
            return;
          }
          SL_DEBUG(logger, "Source failed: {}", item.error().message());
          post(dispatcher,
               logger,
               [downstream, completion{Completion::failed(item.error())}] {
                 complete(*downstream, completion);
               });
          return;
        }
        if (not item.value().has_value()) {
          SL_TRACE(logger, "Source exhausted");
          post(dispatcher, logger, [downstream] {
            complete(*downstream, Completion::finished());
          });
          return;
        }
        auto delivered = post(
            dispatcher,
            logger,
            [downstream, value{std::move(*item.value())}] {
              downstream->exclusiveAccess([&](const Downstream &cell) {
                // the downstream may cancel from inside receive
                if (auto target = cell) {
                  target->receive(value);
                }
              });
            });
        if (not delivered) {
          return;
        }
      }
    }

    static void complete(DownstreamCell &cell, const Completion &completion) {
      cell.exclusiveAccess([&](Downstream &downstream) {
        if (auto target = std::exchange(downstream, nullptr)) {
          target->receiveCompletion(completion);
        }
      });
    }

    template <typename F>
    static bool post(const std::shared_ptr<se::Dispatcher> &dispatcher,
                     const log::Logger &logger,
                     F &&task) {
      if (dispatcher->add(toTid(DeliveryContext::kMain),
                          std::forward<F>(task))) {
        return true;
      }
      SL_WARN(logger, "Delivery context is gone; pull loop stops");
      return false;
    }

    std::shared_ptr<DownstreamCell> downstream_;
    std::shared_ptr<se::Dispatcher> dispatcher_;
    log::Logger logger_;
    std::jthread thread_;
  };

  /**
   * @brief Republishes a single-pass pull sequence as a push stream.
   *
   * The first subscriber takes over the sequence. Any later subscriber is
   * completed at once with `StreamError::ALREADY_SUBSCRIBED`.
   */
  template <stream::PullSequence Seq>
  class StreamPublisher {
   public:
    using Output = typename Seq::Element;

    StreamPublisher(Seq source,
                    std::shared_ptr<se::Dispatcher> dispatcher,
                    log::Logger logger)
        : source_(std::move(source)),
          dispatcher_(std::move(dispatcher)),
          logger_(std::move(logger)) {}

    std::shared_ptr<Subscription> subscribe(
        std::shared_ptr<Subscriber<Output>> downstream) {
      std::optional<Seq> source;
      {
        std::lock_guard lock(source_mutex_);
        if (source_) {
          source.emplace(std::move(*source_));
          source_.reset();
        }
      }

      if (not source) {
        SL_WARN(logger_, "Second subscriber rejected");
        auto subscription = std::make_shared<InertSubscription>();
        downstream->receiveSubscription(subscription);
        downstream->receiveCompletion(
            Completion::failed(stream::StreamError::ALREADY_SUBSCRIBED));
        return subscription;
      }

      auto subscription = std::make_shared<PullSubscription<Seq>>(
          downstream, dispatcher_, logger_);
      downstream->receiveSubscription(subscription);
      subscription->start(std::move(*source));
      SL_TRACE(logger_, "Subscriber attached");
      return subscription;
    }

   private:
    std::mutex source_mutex_;
    std::optional<Seq> source_;
    std::shared_ptr<se::Dispatcher> dispatcher_;
    log::Logger logger_;
  };

}  // namespace prefs::bridge
