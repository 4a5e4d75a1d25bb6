/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace prefs {

  /**
   * @brief Error codes returned by store operations.
   */
  enum class StoreError : uint8_t {
    EMPTY_KEY = 1,  ///< key must not be empty
    STORE_GONE,     ///< store instance has already been destroyed
  };

}  // namespace prefs

OUTCOME_HPP_DECLARE_ERROR(prefs, StoreError);
