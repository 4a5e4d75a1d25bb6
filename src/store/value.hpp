/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <qtils/byte_vec.hpp>

namespace prefs {

  using StringArray = std::vector<std::string>;

  /**
   * A value as kept by a store. Mirrors the property-list subset a platform
   * defaults database accepts.
   */
  using Value = std::variant<bool,
                             int64_t,
                             double,
                             std::string,
                             qtils::ByteVec,
                             StringArray>;

  /// Absent entries are represented by std::nullopt
  using OptValue = std::optional<Value>;

  using Dictionary = std::unordered_map<std::string, Value>;

}  // namespace prefs
