/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/log/logger.hpp>

#include <iostream>
#include <mutex>

#include <swarm/log/configurator.hpp>

namespace swarm::log {

  namespace {
    std::mutex logging_system_mutex;
    std::shared_ptr<soralog::LoggingSystem> logging_system;

    soralog::LoggingSystem &ensureLoggingSystem() {
      std::lock_guard lock{logging_system_mutex};
      if (logging_system == nullptr) {
        logging_system = std::make_shared<soralog::LoggingSystem>(
            std::make_shared<Configurator>());
        auto r = logging_system->configure();
        if (r.has_error) {
          std::cerr << "swarm default logging config: " << r.message
                    << std::endl;
        }
      }
      return *logging_system;
    }
  }  // namespace

  void setLoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> system) {
    std::lock_guard lock{logging_system_mutex};
    logging_system = std::move(system);
  }

  Logger createLogger(const std::string &tag) {
    return createLogger(tag, kDefaultGroupName);
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return std::static_pointer_cast<soralog::Logger>(
        ensureLoggingSystem().getLogger(tag, group));
  }

  void setLevelOfGroup(const std::string &group_name, Level level) {
    ensureLoggingSystem().setLevelOfGroup(group_name, level);
  }

  void resetLevelOfGroup(const std::string &group_name) {
    ensureLoggingSystem().resetLevelOfGroup(group_name);
  }

}  // namespace swarm::log
