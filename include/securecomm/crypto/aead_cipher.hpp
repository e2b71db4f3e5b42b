/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <securecomm/common/types.hpp>
#include <securecomm/crypto/common.hpp>
#include <securecomm/crypto/key.hpp>
#include <securecomm/outcome/outcome.hpp>

namespace securecomm::crypto {

  using common::AeadAlgorithm;

  /**
   * @class AeadCipher provides authenticated encryption of byte payloads.
   * Sealed messages have the layout nonce || ciphertext || tag.
   */
  class AeadCipher {
   public:
    virtual ~AeadCipher() = default;

    /**
     * Encrypts the plaintext under a fresh random nonce
     * @param plaintext - data to protect, may be empty
     * @param key - symmetric key
     * @return sealed message
     */
    virtual outcome::result<Bytes> seal(BytesIn plaintext,
                                        const SymmetricKey &key) const = 0;

    /**
     * Authenticates and decrypts a sealed message
     * @param sealed - nonce || ciphertext || tag
     * @param key - symmetric key
     * @return plaintext or SecureCommError::AUTHENTICATION_FAILED
     */
    virtual outcome::result<Bytes> open(BytesIn sealed,
                                        const SymmetricKey &key) const = 0;

    /**
     * Encrypts with the given nonce
     * @return ciphertext || tag
     */
    virtual outcome::result<Bytes> encrypt(const SymmetricKey &key,
                                           BytesIn nonce,
                                           BytesIn plaintext,
                                           BytesIn aad) const = 0;

    /**
     * Decrypts ciphertext || tag produced with the given nonce
     * @return plaintext, error if the tag doesn't match
     */
    virtual outcome::result<Bytes> decrypt(const SymmetricKey &key,
                                           BytesIn nonce,
                                           BytesIn ciphertext,
                                           BytesIn aad) const = 0;

    virtual size_t nonceSize() const = 0;

    virtual size_t tagSize() const = 0;

    virtual AeadAlgorithm algorithm() const = 0;
  };

}  // namespace securecomm::crypto
