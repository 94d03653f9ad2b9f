/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <swarm/log/simple.hpp>

namespace testutil {
  /// Console logging for tests, configured once per process.
  inline void prepareLoggers(swarm::log::Level level = swarm::log::Level::INFO) {
    static bool prepared = false;
    if (not prepared) {
      swarm::simpleLoggingSystem(level);
      prepared = true;
      return;
    }
    swarm::log::setLevelOfGroup(swarm::log::kDefaultGroupName, level);
  }
}  // namespace testutil
