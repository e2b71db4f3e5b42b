/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/common/literals.hpp>

#include <securecomm/common/hexutil.hpp>

namespace securecomm::common {
  std::vector<uint8_t> operator""_v(const char *c, std::size_t s) {
    std::vector<uint8_t> chars(c, c + s);  // NOLINT
    return chars;
  }

  std::vector<uint8_t> operator""_unhex(const char *c, std::size_t s) {
    return unhex(std::string_view(c, s)).value();
  }
}  // namespace securecomm::common
