/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <swarm/log/configurator.hpp>

namespace swarm::log {

  namespace {
    std::string embedded_config(R"(
# ----------------
sinks:
  - name: console
    type: console
    color: true
groups:
  - name: swarm
    sink: console
    level: info
    is_fallback: true
    children:
      - name: pushsync
      - name: network
      - name: accounting
      - name: pricer
# ----------------
  )");
  }  // namespace

  Configurator::Configurator() : ConfiguratorFromYAML(embedded_config) {}

  Configurator::Configurator(std::string config)
      : ConfiguratorFromYAML(std::move(config)) {}

  Configurator::Configurator(std::filesystem::path config_path)
      : ConfiguratorFromYAML(std::move(config_path)) {}

}  // namespace swarm::log
