/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <filesystem>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <yaml-cpp/yaml.h>

#include "config/store_configuration.hpp"
#include "store/value.hpp"

namespace prefs::config {

  enum class ConfigError : uint8_t {
    NOT_A_MAP = 1,
    UNSUPPORTED_NODE,
    UNREADABLE_FILE,
  };
  Q_ENUM_ERROR_CODE(ConfigError) {
    using E = decltype(e);
    switch (e) {
      case E::NOT_A_MAP:
        return "Defaults document is not a map";
      case E::UNSUPPORTED_NODE:
        return "Defaults entry has no stored representation";
      case E::UNREADABLE_FILE:
        return "Defaults file cannot be read";
    }
    abort();
  }

  /**
   * Converts a YAML map into default values.
   *
   * Plain scalars become booleans, integers or floating values when they
   * parse as such, otherwise strings; quoted scalars are always strings;
   * `!!binary` scalars become bytes; sequences of scalars become string
   * arrays. Anything else is rejected with UNSUPPORTED_NODE.
   */
  outcome::result<Dictionary> loadDefaults(const YAML::Node &node);

  outcome::result<Dictionary> loadDefaultsFile(
      const std::filesystem::path &path);

  /// Loads @p node and registers its entries, prefixed, as defaults of the
  /// configured store
  outcome::result<void> registerDefaults(
      const StoreConfiguration &configuration, const YAML::Node &node);

}  // namespace prefs::config
