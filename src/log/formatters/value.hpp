/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <type_traits>
#include <variant>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "store/value.hpp"

template <>
struct fmt::formatter<prefs::Value> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const prefs::Value &value, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return std::visit(
        [&](const auto &v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::string>) {
            return fmt::format_to(ctx.out(), "\"{}\"", v);
          } else if constexpr (std::is_same_v<T, qtils::ByteVec>) {
            return fmt::format_to(ctx.out(), "<{} bytes>", v.size());
          } else {
            return fmt::format_to(ctx.out(), "{}", v);
          }
        },
        value);
  }
};

template <>
struct fmt::formatter<prefs::OptValue> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const prefs::OptValue &value, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (not value) {
      return fmt::format_to(ctx.out(), "<none>");
    }
    return fmt::format_to(ctx.out(), "{}", *value);
  }
};
