/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "store/in_memory/in_memory_store.hpp"

#include <algorithm>

#include "store/store_error.hpp"

namespace prefs {

  OptValue InMemoryStore::State::effective(const std::string &key) const {
    if (auto it = values.find(key); it != values.end()) {
      return it->second;
    }
    if (auto it = defaults.find(key); it != defaults.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  std::vector<std::shared_ptr<KeyObserver>>
  InMemoryStore::State::liveObservers(const std::string &key) {
    std::vector<std::shared_ptr<KeyObserver>> live;
    auto it = observers.find(key);
    if (it == observers.end()) {
      return live;
    }
    std::erase_if(it->second, [&](const Registration &registration) {
      auto observer = registration.observer.lock();
      if (not observer) {
        return true;
      }
      live.emplace_back(std::move(observer));
      return false;
    });
    if (it->second.empty()) {
      observers.erase(it);
    }
    return live;
  }

  InMemoryStore::InMemoryStore(Dictionary values)
      : state_(State{.values = std::move(values)}) {}

  std::shared_ptr<InMemoryStore> InMemoryStore::standard() {
    static auto instance = std::make_shared<InMemoryStore>();
    return instance;
  }

  template <typename F>
  void InMemoryStore::modify(F &&mutate) {
    std::unique_lock write_lock(write_cs_);

    auto changes = state_.exclusiveAccess([&](State &state) {
      std::vector<Change> changes;
      // must be called before the key is modified
      auto touch = [&](const std::string &key) {
        if (std::ranges::any_of(changes, [&](const Change &change) {
              return change.key == key;
            })) {
          return;
        }
        changes.emplace_back(
            Change{.key = key, .old_value = state.effective(key)});
      };

      std::forward<F>(mutate)(state, touch);

      std::erase_if(changes, [&](Change &change) {
        change.new_value = state.effective(change.key);
        if (change.old_value == change.new_value) {
          return true;
        }
        change.observers = state.liveObservers(change.key);
        return change.observers.empty();
      });
      return changes;
    });

    // observers run without the state lock, so they can read and write back
    for (const auto &change : changes) {
      for (const auto &observer : change.observers) {
        observer->onKeyChanged(change.key, change.old_value, change.new_value);
      }
    }
  }

  OptValue InMemoryStore::read(std::string_view key) const {
    return state_.sharedAccess(
        [key = std::string(key)](const State &state) {
          return state.effective(key);
        });
  }

  outcome::result<void> InMemoryStore::write(std::string_view key,
                                             Value value) {
    if (key.empty()) {
      return StoreError::EMPTY_KEY;
    }
    modify([&](State &state, auto &touch) {
      std::string k(key);
      touch(k);
      state.values[k] = std::move(value);
    });
    return outcome::success();
  }

  outcome::result<void> InMemoryStore::remove(std::string_view key) {
    if (key.empty()) {
      return StoreError::EMPTY_KEY;
    }
    modify([&](State &state, auto &touch) {
      std::string k(key);
      touch(k);
      state.values.erase(k);
    });
    return outcome::success();
  }

  void InMemoryStore::registerDefaults(const Dictionary &defaults) {
    modify([&](State &state, auto &touch) {
      for (const auto &[key, value] : defaults) {
        if (key.empty()) {
          continue;
        }
        // a user value shadows the default, so nothing changes for observers
        touch(key);
        state.defaults[key] = value;
      }
    });
  }

  Dictionary InMemoryStore::dictionaryRepresentation() const {
    return state_.sharedAccess([](const State &state) {
      auto result = state.defaults;
      for (const auto &[key, value] : state.values) {
        result[key] = value;
      }
      return result;
    });
  }

  outcome::result<OptValue> InMemoryStore::addObserver(
      std::string_view key, std::weak_ptr<KeyObserver> observer) {
    if (key.empty()) {
      return StoreError::EMPTY_KEY;
    }
    auto id = observer.lock();
    return state_.exclusiveAccess([&](State &state) {
      std::string k(key);
      if (not id) {
        return state.effective(k);
      }
      state.observers[k].emplace_back(
          Registration{.id = id.get(), .observer = std::move(observer)});
      return state.effective(k);
    });
  }

  void InMemoryStore::removeObserver(std::string_view key,
                                     const KeyObserver &observer) {
    state_.exclusiveAccess([&](State &state) {
      auto it = state.observers.find(std::string(key));
      if (it == state.observers.end()) {
        return;
      }
      std::erase_if(it->second, [&](const Registration &registration) {
        return registration.id == &observer;
      });
      if (it->second.empty()) {
        state.observers.erase(it);
      }
    });
  }

  void InMemoryStore::reset() {
    modify([](State &state, auto &touch) {
      for (const auto &[key, _] : state.values) {
        touch(key);
      }
      state.values.clear();
    });
  }

  void InMemoryStore::clear() {
    modify([](State &state, auto &touch) {
      for (const auto &[key, _] : state.values) {
        touch(key);
      }
      for (const auto &[key, _] : state.defaults) {
        touch(key);
      }
      state.values.clear();
      state.defaults.clear();
    });
  }

  void InMemoryStore::unregisterDefaults() {
    modify([](State &state, auto &touch) {
      for (const auto &[key, _] : state.defaults) {
        touch(key);
      }
      state.defaults.clear();
    });
  }

  size_t InMemoryStore::observersCount(std::string_view key) const {
    return state_.sharedAccess([&](const State &state) -> size_t {
      auto it = state.observers.find(std::string(key));
      return it == state.observers.end() ? 0 : it->second.size();
    });
  }

}  // namespace prefs
