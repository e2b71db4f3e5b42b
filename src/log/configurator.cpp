/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/log/configurator.hpp>

namespace securecomm::log {

  namespace {
    const std::string embedded_config(R"(
# This is securecomm configuration part of logging system
# ------------- Begin of securecomm config --------------
groups:
  - name: securecomm
    level: off
    children:
      - name: crypto
        children:
          - name: key_agreement
          - name: aead
          - name: mac
          - name: messenger
      - name: storage
        children:
          - name: sqlite
# --------------- End of securecomm config ---------------)");
  }  // namespace

  Configurator::Configurator() : ConfiguratorFromYAML(embedded_config) {}

  Configurator::Configurator(std::string config)
      : soralog::ConfiguratorFromYAML(std::move(config)) {}

}  // namespace securecomm::log
