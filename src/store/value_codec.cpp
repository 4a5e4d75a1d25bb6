/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "store/value_codec.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <string_view>

OUTCOME_CPP_DEFINE_CATEGORY(prefs, CodecError, e) {
  using E = prefs::CodecError;
  switch (e) {
    case E::TYPE_MISMATCH:
      return "stored value has an incompatible type";
    case E::OUT_OF_RANGE:
      return "stored number is out of range";
  }
  return "unknown CodecError";
}

namespace prefs {

  namespace {
    std::string_view trim(std::string_view s) {
      auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
      while (not s.empty() and is_space(s.front())) {
        s.remove_prefix(1);
      }
      while (not s.empty() and is_space(s.back())) {
        s.remove_suffix(1);
      }
      return s;
    }

    template <typename N>
    std::optional<N> parseNumber(std::string_view s) {
      s = trim(s);
      N n{};
      auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
      if (ec != std::errc{} or ptr != s.data() + s.size()) {
        return std::nullopt;
      }
      return n;
    }

    outcome::result<int64_t> fromDouble(double d) {
      if (not std::isfinite(d)
          or d < static_cast<double>(std::numeric_limits<int64_t>::min())
          or d >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return CodecError::OUT_OF_RANGE;
      }
      return static_cast<int64_t>(d);
    }
  }  // namespace

  outcome::result<bool> ValueCodec<bool>::decode(const Value &v) {
    if (auto b = std::get_if<bool>(&v)) {
      return *b;
    }
    if (auto i = std::get_if<int64_t>(&v)) {
      return *i != 0;
    }
    if (auto d = std::get_if<double>(&v)) {
      return *d != 0.0;
    }
    if (auto s = std::get_if<std::string>(&v)) {
      std::string str{trim(*s)};
      std::ranges::transform(str, str.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
      });
      if (auto n = parseNumber<int64_t>(str)) {
        return *n != 0;
      }
      if (str == "true" or str == "yes" or str == "y" or str == "on") {
        return true;
      }
      if (str == "false" or str == "no" or str == "n" or str == "off") {
        return false;
      }
    }
    return CodecError::TYPE_MISMATCH;
  }

  outcome::result<int64_t> ValueCodec<int64_t>::decode(const Value &v) {
    if (auto i = std::get_if<int64_t>(&v)) {
      return *i;
    }
    if (auto b = std::get_if<bool>(&v)) {
      return *b ? 1 : 0;
    }
    if (auto d = std::get_if<double>(&v)) {
      return fromDouble(*d);
    }
    if (auto s = std::get_if<std::string>(&v)) {
      if (auto n = parseNumber<int64_t>(*s)) {
        return *n;
      }
    }
    return CodecError::TYPE_MISMATCH;
  }

  outcome::result<int> ValueCodec<int>::decode(const Value &v) {
    OUTCOME_TRY(n, ValueCodec<int64_t>::decode(v));
    if (n < std::numeric_limits<int>::min()
        or n > std::numeric_limits<int>::max()) {
      return CodecError::OUT_OF_RANGE;
    }
    return static_cast<int>(n);
  }

  outcome::result<double> ValueCodec<double>::decode(const Value &v) {
    if (auto d = std::get_if<double>(&v)) {
      return *d;
    }
    if (auto i = std::get_if<int64_t>(&v)) {
      return static_cast<double>(*i);
    }
    if (auto b = std::get_if<bool>(&v)) {
      return *b ? 1.0 : 0.0;
    }
    if (auto s = std::get_if<std::string>(&v)) {
      if (auto n = parseNumber<double>(*s)) {
        return *n;
      }
    }
    return CodecError::TYPE_MISMATCH;
  }

  outcome::result<float> ValueCodec<float>::decode(const Value &v) {
    OUTCOME_TRY(d, ValueCodec<double>::decode(v));
    if (std::isfinite(d) and std::abs(d) > std::numeric_limits<float>::max()) {
      return CodecError::OUT_OF_RANGE;
    }
    return static_cast<float>(d);
  }

  outcome::result<std::string> ValueCodec<std::string>::decode(
      const Value &v) {
    if (auto s = std::get_if<std::string>(&v)) {
      return *s;
    }
    return CodecError::TYPE_MISMATCH;
  }

  outcome::result<qtils::ByteVec> ValueCodec<qtils::ByteVec>::decode(
      const Value &v) {
    if (auto bytes = std::get_if<qtils::ByteVec>(&v)) {
      return *bytes;
    }
    return CodecError::TYPE_MISMATCH;
  }

  outcome::result<StringArray> ValueCodec<StringArray>::decode(
      const Value &v) {
    if (auto array = std::get_if<StringArray>(&v)) {
      return *array;
    }
    return CodecError::TYPE_MISMATCH;
  }

}  // namespace prefs
