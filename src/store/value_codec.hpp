/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "store/value.hpp"

namespace prefs {

  enum class CodecError : uint8_t {
    TYPE_MISMATCH = 1,  ///< stored value cannot be interpreted as the type
    OUT_OF_RANGE,       ///< stored number does not fit into the type
  };

  /**
   * Conversion between a typed setting and its stored representation.
   * Specialize for custom types; `decode` must not throw.
   */
  template <typename T>
  struct ValueCodec;

  template <typename T>
  concept Codable = requires(const T &t, const Value &v) {
    { ValueCodec<T>::encode(t) } -> std::convertible_to<Value>;
    { ValueCodec<T>::decode(v) } -> std::same_as<outcome::result<T>>;
  };

  // Numeric decoders coerce between bool, integer and floating values the
  // way a platform defaults database does; strings are parsed.

  template <>
  struct ValueCodec<bool> {
    static Value encode(bool v) {
      return v;
    }
    static outcome::result<bool> decode(const Value &v);
  };

  template <>
  struct ValueCodec<int64_t> {
    static Value encode(int64_t v) {
      return v;
    }
    static outcome::result<int64_t> decode(const Value &v);
  };

  template <>
  struct ValueCodec<int> {
    static Value encode(int v) {
      return static_cast<int64_t>(v);
    }
    static outcome::result<int> decode(const Value &v);
  };

  template <>
  struct ValueCodec<double> {
    static Value encode(double v) {
      return v;
    }
    static outcome::result<double> decode(const Value &v);
  };

  template <>
  struct ValueCodec<float> {
    static Value encode(float v) {
      return static_cast<double>(v);
    }
    static outcome::result<float> decode(const Value &v);
  };

  template <>
  struct ValueCodec<std::string> {
    static Value encode(const std::string &v) {
      return v;
    }
    static outcome::result<std::string> decode(const Value &v);
  };

  template <>
  struct ValueCodec<qtils::ByteVec> {
    static Value encode(const qtils::ByteVec &v) {
      return v;
    }
    static outcome::result<qtils::ByteVec> decode(const Value &v);
  };

  template <>
  struct ValueCodec<StringArray> {
    static Value encode(const StringArray &v) {
      return v;
    }
    static outcome::result<StringArray> decode(const Value &v);
  };

}  // namespace prefs

OUTCOME_HPP_DECLARE_ERROR(prefs, CodecError);
