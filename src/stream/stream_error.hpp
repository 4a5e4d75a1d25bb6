/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace prefs::stream {

  enum class StreamError : uint8_t {
    /// the consumer stopped waiting; not a failure of the source
    CANCELLED = 1,
    /// a single-pass sequence was handed to a second consumer
    ALREADY_SUBSCRIBED,
  };

}  // namespace prefs::stream

OUTCOME_HPP_DECLARE_ERROR(prefs::stream, StreamError);
