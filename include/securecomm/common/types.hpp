/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

namespace securecomm::common {
  /// Hash512 as a sequence of 64 bytes
  using Hash512 = std::array<uint8_t, 64u>;
}  // namespace securecomm::common

namespace securecomm {

  /// @brief convenience alias for arrays of bytes
  using Bytes = std::vector<uint8_t>;

  /// @brief convenience alias for immutable span of bytes
  using BytesIn = std::span<const uint8_t>;

  /// @brief convenience alias for mutable span of bytes
  using BytesOut = std::span<uint8_t>;

  template <class T>
  concept SpanOfBytes = std::is_same_v<std::decay_t<T>, BytesIn>
                     or std::is_same_v<std::decay_t<T>, BytesOut>;

  inline bool operator==(const SpanOfBytes auto &lhs,
                         const SpanOfBytes auto &rhs) {
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
  }

}  // namespace securecomm
