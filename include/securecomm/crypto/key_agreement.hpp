/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <securecomm/common/types.hpp>
#include <securecomm/crypto/common.hpp>
#include <securecomm/crypto/key.hpp>
#include <securecomm/outcome/outcome.hpp>

namespace securecomm::crypto {

  using common::PublicKeyEncoding;

  /// Lifecycle of the local private key as observed by this process
  enum class KeyState {
    ABSENT,    ///< no key is known to exist
    CREATING,  ///< a thread is generating and persisting the key
    PRESENT,   ///< the key was loaded or created
  };

  /**
   * @class KeyAgreement derives symmetric keys shared with a peer from the
   * local P-256 private key and the peer's public key (ECDH + HKDF-SHA512)
   */
  class KeyAgreement {
   public:
    /// storage tag used unless the application picks its own
    static constexpr auto kDefaultKeyTag =
        "securecomm.keystore.p256.keyagreement.privatekey";

    struct Config {
      /// storage tag of the private key handle
      std::string key_tag;
    };

    virtual ~KeyAgreement() = default;

    /**
     * Returns own public key, the private key is created on first use
     * @param encoding - output format
     * @return encoded key, SecureCommError::HARDWARE_UNAVAILABLE or
     * SecureCommError::STORAGE_FAILURE
     */
    virtual outcome::result<Bytes> localPublicKey(
        PublicKeyEncoding encoding) const = 0;

    /**
     * Validates and decodes a peer public key
     * @param key_bytes - encoded key
     * @param encoding - format of key_bytes
     * @return key or SecureCommError::MALFORMED_KEY
     */
    virtual outcome::result<PublicKey> parsePublicKey(
        BytesIn key_bytes, PublicKeyEncoding encoding) const = 0;

    /**
     * Derives a 32 bytes key shared with the owner of peer's private key;
     * both parties get the same key when they use the same salt
     * @param peer - public key of the other party
     * @param salt - non-secret HKDF salt agreed by the parties
     * @return symmetric key, SecureCommError::HARDWARE_UNAVAILABLE or
     * SecureCommError::STORAGE_FAILURE
     */
    virtual outcome::result<SymmetricKey> deriveSymmetricKey(
        const PublicKey &peer, BytesIn salt) const = 0;

    /**
     * Deletes the persisted private key; the next use creates a new one
     * @return SecureCommError::STORAGE_FAILURE on storage error
     */
    virtual outcome::result<void> deleteLocalKey() = 0;

    /// state of the key with the configured tag in this process
    virtual KeyState keyState() const = 0;
  };

}  // namespace securecomm::crypto
