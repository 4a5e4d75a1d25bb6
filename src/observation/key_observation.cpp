/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "observation/key_observation.hpp"

#include <optional>
#include <utility>

#include "log/formatters/value.hpp"
#include "store/store_error.hpp"

namespace prefs::observation {

  KeyObservation::KeyObservation(std::weak_ptr<Store> store,
                                 std::string key,
                                 ChangeCallback callback,
                                 log::Logger logger)
      : store_(std::move(store)),
        key_(std::move(key)),
        callback_(std::move(callback)),
        logger_(std::move(logger)) {}

  outcome::result<std::shared_ptr<KeyObservation>> KeyObservation::create(
      const std::shared_ptr<Store> &store,
      std::string key,
      ChangeCallback callback,
      log::Logger logger) {
    if (key.empty()) {
      return StoreError::EMPTY_KEY;
    }
    if (not store) {
      return StoreError::STORE_GONE;
    }

    // private constructor
    std::shared_ptr<KeyObservation> observation(new KeyObservation(
        store, std::move(key), std::move(callback), std::move(logger)));

    OUTCOME_TRY(current, store->addObserver(observation->key_, observation));
    SL_TRACE(observation->logger_,
             "Observing '{}', current value {}",
             observation->key_,
             current);

    observation->deliverInitial(current);
    return observation;
  }

  void KeyObservation::deliverInitial(const OptValue &current) {
    callback_(current, current);
    while (true) {
      auto change = backlog_.exclusiveAccess(
          [](Backlog &backlog) -> std::optional<Change> {
            if (backlog.changes.empty()) {
              backlog.flushed = true;
              return std::nullopt;
            }
            auto front = std::move(backlog.changes.front());
            backlog.changes.pop_front();
            return front;
          });
      if (not change) {
        return;
      }
      if (isCancelled()) {
        continue;
      }
      callback_(change->first, change->second);
    }
  }

  KeyObservation::~KeyObservation() {
    cancel();
  }

  void KeyObservation::onKeyChanged(std::string_view key,
                                    const OptValue &old_value,
                                    const OptValue &new_value) {
    if (key != key_) {
      SL_WARN(logger_,
              "Notification for key '{}' received by observation of '{}'; "
              "ignored",
              key,
              key_);
      return;
    }
    if (isCancelled()) {
      return;
    }
    auto held_back = backlog_.exclusiveAccess([&](Backlog &backlog) {
      if (backlog.flushed) {
        return false;
      }
      backlog.changes.emplace_back(old_value, new_value);
      return true;
    });
    if (held_back) {
      SL_TRACE(logger_, "'{}' changed before initial delivery", key_);
      return;
    }
    SL_TRACE(logger_, "'{}' changed: {} -> {}", key_, old_value, new_value);
    callback_(old_value, new_value);
  }

  void KeyObservation::cancel() {
    // only the first caller gets the store back
    auto store = store_.exclusiveAccess(
        [](std::weak_ptr<Store> &store) { return std::exchange(store, {}); });
    if (auto locked = store.lock()) {
      locked->removeObserver(key_, *this);
      SL_TRACE(logger_, "Observation of '{}' cancelled", key_);
    }
  }

  bool KeyObservation::isCancelled() const {
    return store_.exclusiveAccess(
        [](const std::weak_ptr<Store> &store) { return store.expired(); });
  }

  outcome::result<CancelHandle> observe(const std::shared_ptr<Store> &store,
                                        std::string key,
                                        ChangeCallback callback,
                                        log::Logger logger) {
    OUTCOME_TRY(observation,
                KeyObservation::create(store,
                                       std::move(key),
                                       std::move(callback),
                                       std::move(logger)));
    return CancelHandle(std::move(observation));
  }

}  // namespace prefs::observation
