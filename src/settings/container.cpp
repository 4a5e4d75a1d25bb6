/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "settings/container.hpp"

#include <boost/assert.hpp>

namespace prefs::settings {

  Container::Container(
      std::shared_ptr<config::StoreConfiguration> configuration,
      std::shared_ptr<se::Dispatcher> dispatcher,
      qtils::SharedRef<log::LoggingSystem> logsys)
      : configuration_(std::move(configuration)),
        dispatcher_(std::move(dispatcher)),
        logger_(logsys->getLogger("Container", "settings")),
        observation_logger_(logsys->getLogger("KeyObservation", "observation")),
        bridge_logger_(logsys->getLogger("StreamPublisher", "bridge")) {
    BOOST_ASSERT(configuration_ != nullptr);
    BOOST_ASSERT(dispatcher_ != nullptr);
  }

  std::shared_ptr<Store> Container::store() const {
    return configuration_->store();
  }

  outcome::result<CancelHandle> Container::observer(
      std::string key, observation::ChangeCallback callback) {
    return observation::observe(
        store(), std::move(key), std::move(callback), observation_logger_);
  }

}  // namespace prefs::settings
