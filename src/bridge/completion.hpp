/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>

namespace prefs::bridge {

  /// Terminal event of a subscription: finished, or failed with an error
  struct Completion {
    std::error_code error;

    static Completion finished() {
      return {};
    }

    static Completion failed(std::error_code error) {
      return {.error = error};
    }

    bool isFinished() const {
      return not error;
    }

    bool operator==(const Completion &) const = default;
  };

}  // namespace prefs::bridge
