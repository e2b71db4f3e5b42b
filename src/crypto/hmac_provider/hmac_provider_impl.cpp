/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/crypto/hmac_provider/hmac_provider_ctr_impl.hpp>
#include <securecomm/crypto/hmac_provider/hmac_provider_impl.hpp>

namespace securecomm::crypto::hmac {

  outcome::result<Bytes> HmacProviderImpl::calculateDigest(
      HashType hash_type, BytesIn key, BytesIn message) const {
    HmacProviderCtrImpl hmac{hash_type, key};
    OUTCOME_TRY(hmac.write(message));
    return hmac.digest();
  }

}  // namespace securecomm::crypto::hmac
