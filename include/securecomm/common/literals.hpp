/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <vector>

#include <securecomm/common/types.hpp>

namespace securecomm::common {
  std::vector<uint8_t> operator""_v(const char *c, std::size_t s);

  std::vector<uint8_t> operator""_unhex(const char *c, std::size_t s);
}  // namespace securecomm::common
