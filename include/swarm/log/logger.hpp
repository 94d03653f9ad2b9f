/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

namespace swarm::log {

  using Level = soralog::Level;
  using Logger = std::shared_ptr<soralog::Logger>;

  inline const std::string kDefaultGroupName{"swarm"};

  /**
   * Install logging system used by `createLogger`.
   * If none is installed before the first logger is created, one configured
   * by `log::Configurator` defaults is created.
   */
  void setLoggingSystem(std::shared_ptr<soralog::LoggingSystem> logging_system);

  [[nodiscard]] Logger createLogger(const std::string &tag);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  void setLevelOfGroup(const std::string &group_name, Level level);

  void resetLevelOfGroup(const std::string &group_name);

}  // namespace swarm::log
