/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>

#include <boost/nondet_random.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <securecomm/crypto/random_generator.hpp>

namespace securecomm::crypto::random {
  /**
   * @class BoostRandomGenerator provides implementation
   * of cryptographic-secure random bytes generator;
   * on systems which don't provide true random numbers source
   * it may not compile, so you will need to implement
   * your own random bytes generator
   */
  class BoostRandomGenerator : public CSPRNG {
   public:
    ~BoostRandomGenerator() override = default;

    uint8_t randomByte() override;

    std::vector<uint8_t> randomBytes(size_t len) override;

   private:
    /// one generator is shared by concurrent seal calls
    std::mutex mutex_;
    /// boost cryptographic-secure random generator
    boost::random_device generator_;
    /// uniform distribution tool
    boost::random::uniform_int_distribution<uint8_t> distribution_;
  };
}  // namespace securecomm::crypto::random
