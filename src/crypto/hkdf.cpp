/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/crypto/hkdf.hpp>

#include <algorithm>

#include <openssl/crypto.h>

#include <securecomm/common/final_action.hpp>
#include <securecomm/crypto/error.hpp>
#include <securecomm/crypto/hmac_provider/hmac_provider_ctr_impl.hpp>

namespace securecomm::crypto {

  using HMAC = hmac::HmacProviderCtrImpl;

  outcome::result<Bytes> hkdf(common::HashType hash_type,
                              BytesIn salt,
                              BytesIn ikm,
                              BytesIn info,
                              size_t length) {
    HMAC extract_mac{hash_type, salt};
    const auto hash_size = extract_mac.digestSize();
    if (hash_size == 0) {
      return HmacProviderError::UNSUPPORTED_HASH_METHOD;
    }
    if (length > 255 * hash_size) {
      return HkdfError::OUTPUT_TOO_LONG;
    }

    OUTCOME_TRY(extract_mac.write(ikm));
    OUTCOME_TRY(prk, extract_mac.digest());
    securecomm::common::FinalAction wipe_prk(
        [&prk] { OPENSSL_cleanse(prk.data(), prk.size()); });

    Bytes okm;
    okm.reserve(length);
    Bytes block;
    for (uint8_t counter = 1; okm.size() < length; ++counter) {
      HMAC expand_mac{hash_type, prk};
      OUTCOME_TRY(expand_mac.write(block));
      OUTCOME_TRY(expand_mac.write(info));
      OUTCOME_TRY(expand_mac.write(BytesIn{&counter, 1}));
      OUTCOME_TRY(next, expand_mac.digest());
      OPENSSL_cleanse(block.data(), block.size());
      block = std::move(next);
      auto take = std::min(block.size(), length - okm.size());
      okm.insert(okm.end(), block.begin(), block.begin() + take);
    }
    OPENSSL_cleanse(block.data(), block.size());
    return okm;
  }

}  // namespace securecomm::crypto
