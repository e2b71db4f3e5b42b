/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/crypto/message_authenticator/message_authenticator_impl.hpp>

#include <algorithm>

#include <openssl/crypto.h>

#include <securecomm/crypto/error.hpp>

namespace securecomm::crypto {

  MessageAuthenticatorImpl::MessageAuthenticatorImpl(
      std::shared_ptr<hmac::HmacProvider> hmac_provider)
      : hmac_provider_{std::move(hmac_provider)} {}

  outcome::result<AuthenticationCode> MessageAuthenticatorImpl::computeCode(
      BytesIn message, const SymmetricKey &key) const {
    OUTCOME_TRY(digest,
                hmac_provider_->calculateDigest(
                    common::HashType::SHA512, key.data(), message));
    AuthenticationCode code;
    if (digest.size() != code.size()) {
      log_->error("HMAC-SHA512 produced {} bytes", digest.size());
      return HmacProviderError::WRONG_DIGEST_SIZE;
    }
    std::copy(digest.begin(), digest.end(), code.begin());
    return code;
  }

  bool MessageAuthenticatorImpl::verifyCode(BytesIn code,
                                            BytesIn message,
                                            const SymmetricKey &key) const {
    if (code.size() != AuthenticationCode{}.size()) {
      return false;
    }
    auto expected = computeCode(message, key);
    if (not expected) {
      log_->error("Can not compute authentication code: {}",
                  expected.error());
      return false;
    }
    return 0
        == CRYPTO_memcmp(
               expected.value().data(), code.data(), expected.value().size());
  }

}  // namespace securecomm::crypto
