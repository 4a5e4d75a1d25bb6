/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

#include "stream/pull_sequence.hpp"

namespace prefs::stream {

  /**
   * Pull sequence that applies a projection to every element of @tparam Seq
   * and skips results equal to the previously produced one. Errors and the
   * end of the underlying sequence pass through unchanged.
   */
  template <PullSequence Seq, typename F>
    requires std::equality_comparable<
        std::invoke_result_t<F &, const typename Seq::Element &>>
  class DistinctMap {
   public:
    using Element = std::remove_cvref_t<
        std::invoke_result_t<F &, const typename Seq::Element &>>;

    DistinctMap(Seq source, F projection)
        : source_(std::move(source)), projection_(std::move(projection)) {}

    outcome::result<std::optional<Element>> next(std::stop_token stop) {
      while (true) {
        OUTCOME_TRY(item, source_.next(stop));
        if (not item) {
          return std::optional<Element>{};
        }
        Element projected = std::invoke(projection_, *item);
        if (last_ and *last_ == projected) {
          continue;
        }
        last_.emplace(projected);
        return std::optional<Element>{std::in_place, std::move(projected)};
      }
    }

   private:
    Seq source_;
    F projection_;
    std::optional<Element> last_;
  };

  template <PullSequence Seq, typename F>
  DistinctMap<Seq, F> distinctMap(Seq source, F projection) {
    return DistinctMap<Seq, F>(std::move(source), std::move(projection));
  }

}  // namespace prefs::stream
