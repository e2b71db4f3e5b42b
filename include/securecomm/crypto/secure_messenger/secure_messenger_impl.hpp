/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <securecomm/crypto/aead_cipher.hpp>
#include <securecomm/crypto/key_agreement.hpp>
#include <securecomm/crypto/message_authenticator.hpp>
#include <securecomm/crypto/secure_messenger.hpp>
#include <securecomm/log/logger.hpp>

namespace securecomm::crypto {

  class SecureMessengerImpl : public SecureMessenger {
   public:
    SecureMessengerImpl(std::shared_ptr<KeyAgreement> key_agreement,
                        std::shared_ptr<AeadCipher> cipher,
                        std::shared_ptr<MessageAuthenticator> authenticator);

    outcome::result<Bytes> seal(BytesIn plaintext,
                                const PublicKey &peer,
                                BytesIn salt) const override;

    outcome::result<Bytes> open(BytesIn sealed,
                                const PublicKey &peer,
                                BytesIn salt) const override;

    outcome::result<AuthenticationCode> computeCode(
        BytesIn message, const PublicKey &peer, BytesIn salt) const override;

    outcome::result<bool> verifyCode(BytesIn code,
                                     BytesIn message,
                                     const PublicKey &peer,
                                     BytesIn salt) const override;

   private:
    outcome::result<SymmetricKey> sessionKey(const PublicKey &peer,
                                             BytesIn salt) const;

    std::shared_ptr<KeyAgreement> key_agreement_;
    std::shared_ptr<AeadCipher> cipher_;
    std::shared_ptr<MessageAuthenticator> authenticator_;
    log::Logger log_;
  };

}  // namespace securecomm::crypto
