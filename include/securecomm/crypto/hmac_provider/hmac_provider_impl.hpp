/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <securecomm/crypto/hmac_provider.hpp>

namespace securecomm::crypto::hmac {

  class HmacProviderImpl : public HmacProvider {
   public:
    outcome::result<Bytes> calculateDigest(HashType hash_type,
                                           BytesIn key,
                                           BytesIn message) const override;
  };
}  // namespace securecomm::crypto::hmac
