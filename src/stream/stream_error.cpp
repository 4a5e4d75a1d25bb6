/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stream/stream_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(prefs::stream, StreamError, e) {
  using E = prefs::stream::StreamError;
  switch (e) {
    case E::CANCELLED:
      return "stream consumption was cancelled";
    case E::ALREADY_SUBSCRIBED:
      return "stream already has a consumer";
  }
  return "unknown StreamError";
}
