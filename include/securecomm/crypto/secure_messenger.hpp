/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <securecomm/common/types.hpp>
#include <securecomm/crypto/key.hpp>
#include <securecomm/outcome/outcome.hpp>

namespace securecomm::crypto {

  /**
   * @class SecureMessenger protects messages exchanged with one peer.
   * Every call derives the symmetric key from the local key, the peer public
   * key and the salt, so a replaced or deleted local key takes effect on the
   * next call.
   */
  class SecureMessenger {
   public:
    virtual ~SecureMessenger() = default;

    /**
     * @brief encrypts the message for the peer
     * @param plaintext - data to protect, may be empty
     * @param peer - public key of the receiver
     * @param salt - salt both parties agreed on
     * @return nonce || ciphertext || tag
     */
    virtual outcome::result<Bytes> seal(BytesIn plaintext,
                                        const PublicKey &peer,
                                        BytesIn salt) const = 0;

    /**
     * @brief decrypts the message received from the peer
     * @param sealed - output of seal on the peer side
     * @param peer - public key of the sender
     * @param salt - salt both parties agreed on
     * @return plaintext, SecureCommError::AUTHENTICATION_FAILED if the message
     * was not sealed with the matching key
     */
    virtual outcome::result<Bytes> open(BytesIn sealed,
                                        const PublicKey &peer,
                                        BytesIn salt) const = 0;

    /**
     * @brief calculates HMAC-SHA512 of the message under the derived key
     */
    virtual outcome::result<AuthenticationCode> computeCode(
        BytesIn message, const PublicKey &peer, BytesIn salt) const = 0;

    /**
     * @brief checks the code received from the peer
     * @return true if the code matches, error if no key could be derived
     */
    virtual outcome::result<bool> verifyCode(BytesIn code,
                                             BytesIn message,
                                             const PublicKey &peer,
                                             BytesIn salt) const = 0;
  };

}  // namespace securecomm::crypto
