/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace swarm::log {

  /**
   * Default soralog configuration: console sink, group `swarm` at `info`
   * with child groups per subsystem.
   * Application configs may extend it with `ConfiguratorFromYAML(previous,
   * yaml)`.
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    Configurator();

    explicit Configurator(std::string config);

    explicit Configurator(std::filesystem::path config_path);
  };

}  // namespace swarm::log
