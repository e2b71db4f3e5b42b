/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/crypto/secure_messenger/secure_messenger_impl.hpp>

namespace securecomm::crypto {

  SecureMessengerImpl::SecureMessengerImpl(
      std::shared_ptr<KeyAgreement> key_agreement,
      std::shared_ptr<AeadCipher> cipher,
      std::shared_ptr<MessageAuthenticator> authenticator)
      : key_agreement_{std::move(key_agreement)},
        cipher_{std::move(cipher)},
        authenticator_{std::move(authenticator)},
        log_{log::createLogger("SecureMessenger", "messenger")} {}

  outcome::result<Bytes> SecureMessengerImpl::seal(BytesIn plaintext,
                                                   const PublicKey &peer,
                                                   BytesIn salt) const {
    OUTCOME_TRY(key, sessionKey(peer, salt));
    return cipher_->seal(plaintext, key);
  }

  outcome::result<Bytes> SecureMessengerImpl::open(BytesIn sealed,
                                                   const PublicKey &peer,
                                                   BytesIn salt) const {
    OUTCOME_TRY(key, sessionKey(peer, salt));
    auto plaintext = cipher_->open(sealed, key);
    if (not plaintext) {
      log_->debug("Message of {} bytes was rejected: {}",
                  sealed.size(),
                  plaintext.error());
    }
    return plaintext;
  }

  outcome::result<AuthenticationCode> SecureMessengerImpl::computeCode(
      BytesIn message, const PublicKey &peer, BytesIn salt) const {
    OUTCOME_TRY(key, sessionKey(peer, salt));
    return authenticator_->computeCode(message, key);
  }

  outcome::result<bool> SecureMessengerImpl::verifyCode(
      BytesIn code,
      BytesIn message,
      const PublicKey &peer,
      BytesIn salt) const {
    OUTCOME_TRY(key, sessionKey(peer, salt));
    return authenticator_->verifyCode(code, message, key);
  }

  outcome::result<SymmetricKey> SecureMessengerImpl::sessionKey(
      const PublicKey &peer, BytesIn salt) const {
    auto key = key_agreement_->deriveSymmetricKey(peer, salt);
    if (not key) {
      log_->error("Can not derive a key for the peer: {}", key.error());
    }
    return key;
  }

}  // namespace securecomm::crypto
