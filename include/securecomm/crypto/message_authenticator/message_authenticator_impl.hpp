/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <securecomm/crypto/hmac_provider.hpp>
#include <securecomm/crypto/message_authenticator.hpp>
#include <securecomm/log/logger.hpp>

namespace securecomm::crypto {

  class MessageAuthenticatorImpl : public MessageAuthenticator {
   public:
    explicit MessageAuthenticatorImpl(
        std::shared_ptr<hmac::HmacProvider> hmac_provider);

    outcome::result<AuthenticationCode> computeCode(
        BytesIn message, const SymmetricKey &key) const override;

    bool verifyCode(BytesIn code,
                    BytesIn message,
                    const SymmetricKey &key) const override;

   private:
    std::shared_ptr<hmac::HmacProvider> hmac_provider_;
    log::Logger log_ = log::createLogger("MessageAuthenticator", "mac");
  };

}  // namespace securecomm::crypto
