/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <securecomm/common/types.hpp>
#include <securecomm/crypto/common.hpp>
#include <securecomm/outcome/outcome.hpp>

namespace securecomm::crypto {

  using securecomm::crypto::common::HashType;

  class Hasher {
   public:
    virtual ~Hasher() = default;

    /// appends a new chunk of data
    virtual outcome::result<void> write(BytesIn data) = 0;

    /**
     * Calculates the current digest.
     * Does not affect the internal state.
     * New data still could be fed via write method.
     */
    virtual outcome::result<void> digestOut(BytesOut out) const = 0;

    /// resets the internal state
    virtual outcome::result<void> reset() = 0;

    /// hash size in bytes
    virtual size_t digestSize() const = 0;

    outcome::result<Bytes> digest() const {
      outcome::result<Bytes> result{outcome::success()};
      result.value().resize(digestSize());
      OUTCOME_TRY(digestOut(result.value()));
      return result;
    }
  };
}  // namespace securecomm::crypto
