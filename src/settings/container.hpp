/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <qtils/outcome.hpp>

#include "bridge/stream_publisher.hpp"
#include "config/store_configuration.hpp"
#include "log/logger.hpp"
#include "observation/key_observation.hpp"
#include "se/impl/dispatcher.hpp"
#include "settings/attribute.hpp"
#include "settings/default_registrar.hpp"
#include "stream/async_stream.hpp"
#include "stream/distinct_map.hpp"

namespace prefs::settings {

  /**
   * @brief Typed access to settings kept in the configured store.
   *
   * The store and key prefix are taken from the StoreConfiguration on every
   * call, so reconfiguring it takes effect immediately for new reads,
   * writes and streams. Streams already created stay bound to the store
   * they were created against.
   */
  class Container {
   public:
    Container(std::shared_ptr<config::StoreConfiguration> configuration,
              std::shared_ptr<se::Dispatcher> dispatcher,
              qtils::SharedRef<log::LoggingSystem> logsys);

    const std::shared_ptr<config::StoreConfiguration> &configuration() const {
      return configuration_;
    }

    /// Store currently configured
    std::shared_ptr<Store> store() const;

    /// Full key of @p attr in the store: prefix followed by the name
    template <AnyAttribute A>
    std::string key(const A &attr) const {
      return configuration_->prefix() + attr.name;
    }

    /**
     * Reads the effective value of @p attr. Registers the default first.
     * A value that cannot be decoded reads as the default (or as nullopt
     * for an optional attribute).
     */
    template <AnyAttribute A>
    typename A::ValueType read(const A &attr) {
      auto [store, prefix] = configuration_->snapshot();
      auto key = prefix + attr.name;
      registerDefault(attr, store, key);
      auto decoded = attr.fromStored(store->read(key));
      if (decoded.has_error()) {
        SL_WARN(logger_,
                "Value of '{}' cannot be decoded: {}; default is used",
                key,
                decoded.error().message());
        return attr.fallback();
      }
      return std::move(decoded.value());
    }

    /// Writes @p value; `std::nullopt` for an optional attribute removes
    /// the stored value
    template <AnyAttribute A>
    outcome::result<void> write(const A &attr,
                                const typename A::ValueType &value) {
      auto [store, prefix] = configuration_->snapshot();
      auto key = prefix + attr.name;
      auto stored = attr.toStored(value);
      if (not stored) {
        return store->remove(key);
      }
      return store->write(key, std::move(*stored));
    }

    /// Removes the user value; the attribute reads as its default again
    template <AnyAttribute A>
    outcome::result<void> reset(const A &attr) {
      return store()->remove(key(attr));
    }

    /// Registers the default of @p attr with the current store, once
    template <AnyAttribute A>
    void registerDefault(const A &attr) {
      auto [store, prefix] = configuration_->snapshot();
      registerDefault(attr, store, prefix + attr.name);
    }

    /**
     * Observes @p key of the current store; see KeyObservation. @p key is
     * used as is, without the prefix.
     */
    outcome::result<CancelHandle> observer(
        std::string key, observation::ChangeCallback callback);

    /**
     * Stream of the effective value of @p attr, starting with the current
     * one. Absent values are yielded as the default (or nullopt). A value
     * that cannot be decoded finishes the stream with the decoding error.
     * Dropping the stream ends the observation.
     */
    template <AnyAttribute A>
    stream::AsyncStream<typename A::ValueType> stream(const A &attr) {
      using V = typename A::ValueType;
      auto created = stream::makeStream<V>();
      auto values = std::move(created.first);
      auto continuation = created.second;

      auto [store, prefix] = configuration_->snapshot();
      auto key = prefix + attr.name;
      registerDefault(attr, store, key);

      auto registration = observation::observe(
          store,
          key,
          [attr, continuation](const OptValue &, const OptValue &new_value) {
            auto decoded = attr.fromStored(new_value);
            if (decoded.has_error()) {
              continuation.finish(decoded.error());
              return;
            }
            continuation.yield(std::move(decoded.value()));
          },
          observation_logger_);
      if (registration.has_error()) {
        SL_DEBUG(logger_,
                 "Cannot observe '{}': {}",
                 key,
                 registration.error().message());
        continuation.finish(registration.error());
        return values;
      }

      auto handle =
          std::make_shared<CancelHandle>(std::move(registration.value()));
      continuation.onTermination([handle] { handle->cancel(); });
      return values;
    }

    /// Stream of `projection(value)`, skipping consecutive equal results
    template <AnyAttribute A, typename F>
    auto stream(const A &attr, F projection) {
      return stream::distinctMap(stream(attr), std::move(projection));
    }

    /// Publisher of `stream(attr)` delivering on the main context
    template <AnyAttribute A>
    auto publisher(const A &attr) {
      using Seq = stream::AsyncStream<typename A::ValueType>;
      return bridge::StreamPublisher<Seq>(
          stream(attr), dispatcher_, bridge_logger_);
    }

    /// Publisher of `stream(attr, projection)`
    template <AnyAttribute A, typename F>
    auto publisher(const A &attr, F projection) {
      auto projected = stream(attr, std::move(projection));
      using Seq = decltype(projected);
      return bridge::StreamPublisher<Seq>(
          std::move(projected), dispatcher_, bridge_logger_);
    }

   private:
    template <AnyAttribute A>
    void registerDefault(const A &attr,
                         const std::shared_ptr<Store> &store,
                         const std::string &key) {
      auto encoded = attr.encodedDefault();
      if (not encoded or not registrar_.markRegistered(key, store)) {
        return;
      }
      SL_TRACE(logger_, "Registering default of '{}'", key);
      store->registerDefaults({{key, std::move(*encoded)}});
    }

    std::shared_ptr<config::StoreConfiguration> configuration_;
    std::shared_ptr<se::Dispatcher> dispatcher_;
    log::Logger logger_;
    log::Logger observation_logger_;
    log::Logger bridge_logger_;
    DefaultRegistrar registrar_;
  };

}  // namespace prefs::settings
