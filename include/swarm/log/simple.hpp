/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <iostream>

#include <swarm/log/configurator.hpp>
#include <swarm/log/logger.hpp>

namespace swarm {
  /**
   * Configure console logging at `level` for all swarm groups.
   * Exits on a broken configuration.
   */
  inline void simpleLoggingSystem(log::Level level = log::Level::INFO) {
    auto logsys = std::make_shared<soralog::LoggingSystem>(
        std::make_shared<log::Configurator>());
    auto r = logsys->configure();
    if (not r.message.empty()) {
      std::cerr << "soralog: " << r.message << std::endl;
    }
    if (r.has_error) {
      exit(EXIT_FAILURE);
    }
    log::setLoggingSystem(logsys);
    log::setLevelOfGroup(log::kDefaultGroupName, level);
  }
}  // namespace swarm
