/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>
#include <optional>
#include <stop_token>

#include <qtils/outcome.hpp>

namespace prefs::stream {

  /**
   * Lazy, single-pass source of elements consumed by pulling.
   *
   * `next` blocks until an element is available and returns it; returns an
   * empty optional once the sequence is exhausted, or an error when it
   * failed. When @p stop is requested while waiting it returns
   * `StreamError::CANCELLED`.
   */
  template <typename S>
  concept PullSequence =
      std::move_constructible<S> and requires(S &s, std::stop_token stop) {
        typename S::Element;
        {
          s.next(stop)
        } -> std::same_as<outcome::result<std::optional<typename S::Element>>>;
      };

}  // namespace prefs::stream
