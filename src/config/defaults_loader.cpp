/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/defaults_loader.hpp"

namespace prefs::config {

  namespace {
    // quoted scalars carry the non-specific tag "!"
    bool isQuoted(const YAML::Node &node) {
      return node.Tag() == "!";
    }

    outcome::result<Value> scalarValue(const YAML::Node &node) {
      if (node.Tag() == "tag:yaml.org,2002:binary") {
        auto binary = node.as<YAML::Binary>();
        return Value{qtils::ByteVec(binary.data(),
                                    binary.data() + binary.size())};
      }
      if (isQuoted(node)) {
        return Value{node.Scalar()};
      }
      if (int64_t i{}; YAML::convert<int64_t>::decode(node, i)) {
        return Value{i};
      }
      if (double d{}; YAML::convert<double>::decode(node, d)) {
        return Value{d};
      }
      if (bool b{}; YAML::convert<bool>::decode(node, b)) {
        return Value{b};
      }
      return Value{node.Scalar()};
    }

    outcome::result<Value> nodeValue(const YAML::Node &node) {
      if (node.IsScalar()) {
        return scalarValue(node);
      }
      if (node.IsSequence()) {
        StringArray array;
        for (auto &&item : node) {
          if (not item.IsScalar()) {
            return ConfigError::UNSUPPORTED_NODE;
          }
          array.emplace_back(item.Scalar());
        }
        return Value{std::move(array)};
      }
      return ConfigError::UNSUPPORTED_NODE;
    }
  }  // namespace

  outcome::result<Dictionary> loadDefaults(const YAML::Node &node) {
    if (not node.IsDefined() or node.IsNull()) {
      return Dictionary{};
    }
    if (not node.IsMap()) {
      return ConfigError::NOT_A_MAP;
    }
    Dictionary defaults;
    for (auto &&entry : node) {
      if (not entry.first.IsScalar()) {
        return ConfigError::UNSUPPORTED_NODE;
      }
      OUTCOME_TRY(value, nodeValue(entry.second));
      defaults.emplace(entry.first.Scalar(), std::move(value));
    }
    return defaults;
  }

  outcome::result<Dictionary> loadDefaultsFile(
      const std::filesystem::path &path) {
    YAML::Node root;
    try {
      root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception &) {
      return ConfigError::UNREADABLE_FILE;
    }
    return loadDefaults(root);
  }

  outcome::result<void> registerDefaults(
      const StoreConfiguration &configuration, const YAML::Node &node) {
    OUTCOME_TRY(defaults, loadDefaults(node));
    auto [store, prefix] = configuration.snapshot();
    Dictionary prefixed;
    for (auto &[key, value] : defaults) {
      prefixed.emplace(prefix + key, std::move(value));
    }
    store->registerDefaults(prefixed);
    return outcome::success();
  }

}  // namespace prefs::config
