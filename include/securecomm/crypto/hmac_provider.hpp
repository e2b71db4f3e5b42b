/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <securecomm/common/types.hpp>
#include <securecomm/crypto/common.hpp>
#include <securecomm/crypto/hasher.hpp>
#include <securecomm/outcome/outcome.hpp>

namespace securecomm::crypto::hmac {

  using HashType = common::HashType;

  /// HMAC that supports stream data feeding interface
  class HmacProviderCtr : public Hasher {};

  /**
   * @class HmacProvider provides HMAC functionality
   * allows calculating message authentication code
   * involving a cryptographic hash function
   * and a secret cryptographic key
   */
  class HmacProvider {
   public:
    virtual ~HmacProvider() = default;

    /**
     * @brief calculates digests
     * @param hash_type hash type
     * @param key secret key
     * @param message source message
     * @return message digest if calculation was successful, error otherwise
     */
    virtual outcome::result<Bytes> calculateDigest(HashType hash_type,
                                                   BytesIn key,
                                                   BytesIn message) const = 0;
  };
}  // namespace securecomm::crypto::hmac
