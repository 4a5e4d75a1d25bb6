/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>
#include <optional>
#include <string>

#include <qtils/outcome.hpp>

#include "store/value_codec.hpp"

namespace prefs::settings {

  /**
   * @brief Declaration of one setting: key name, value type and default.
   *
   * The key in the store is the container prefix followed by `name`. A
   * stored value that is absent reads as `default_value`.
   */
  template <typename T>
  struct Attribute {
    static_assert(Codable<T>, "ValueCodec<T> is required");

    using ValueType = T;

    std::string name;
    T default_value{};

    OptValue encodedDefault() const {
      return ValueCodec<T>::encode(default_value);
    }

    T fallback() const {
      return default_value;
    }

    outcome::result<T> fromStored(const OptValue &stored) const {
      if (not stored) {
        return default_value;
      }
      return ValueCodec<T>::decode(*stored);
    }

    OptValue toStored(const T &value) const {
      return ValueCodec<T>::encode(value);
    }
  };

  /**
   * Optional setting. Has no default; an absent stored value reads as
   * `std::nullopt`, and writing `std::nullopt` removes the value.
   */
  template <Codable T>
  struct Attribute<std::optional<T>> {
    using ValueType = std::optional<T>;

    std::string name;

    OptValue encodedDefault() const {
      return std::nullopt;
    }

    ValueType fallback() const {
      return std::nullopt;
    }

    outcome::result<ValueType> fromStored(const OptValue &stored) const {
      if (not stored) {
        return ValueType{};
      }
      OUTCOME_TRY(value, ValueCodec<T>::decode(*stored));
      return ValueType{std::move(value)};
    }

    OptValue toStored(const ValueType &value) const {
      if (not value) {
        return std::nullopt;
      }
      return ValueCodec<T>::encode(*value);
    }
  };

  template <typename A>
  concept AnyAttribute = requires(const A &attr, const OptValue &stored) {
    typename A::ValueType;
    { attr.name } -> std::convertible_to<std::string>;
    { attr.encodedDefault() } -> std::same_as<OptValue>;
    { attr.fromStored(stored) };
  };

}  // namespace prefs::settings
