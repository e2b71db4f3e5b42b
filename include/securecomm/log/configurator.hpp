/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <soralog/impl/configurator_from_yaml.hpp>

namespace securecomm::log {

  /// Embedded YAML with the library's logging groups; the second constructor
  /// takes a complete replacement config
  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    Configurator();

    explicit Configurator(std::string config);
  };

}  // namespace securecomm::log
