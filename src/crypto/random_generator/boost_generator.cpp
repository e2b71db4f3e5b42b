/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/crypto/random_generator/boost_generator.hpp>

namespace securecomm::crypto::random {

  uint8_t BoostRandomGenerator::randomByte() {
    std::lock_guard lock{mutex_};
    return distribution_(generator_);  // NOLINT
  }

  std::vector<uint8_t> BoostRandomGenerator::randomBytes(size_t len) {
    std::vector<uint8_t> buffer(len, 0);
    std::lock_guard lock{mutex_};
    for (auto &byte : buffer) {
      byte = distribution_(generator_);  // NOLINT
    }
    return buffer;
  }
}  // namespace securecomm::crypto::random
