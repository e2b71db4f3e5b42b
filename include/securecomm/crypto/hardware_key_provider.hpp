/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <securecomm/common/types.hpp>
#include <securecomm/crypto/key.hpp>
#include <securecomm/outcome/outcome.hpp>

namespace securecomm::crypto {

  /**
   * @class KeyHandle is an opaque reference to a P-256 private key living
   * inside a HardwareKeyProvider
   */
  class KeyHandle {
   public:
    virtual ~KeyHandle() = default;

    /**
     * @return persistable reference to the key, it can be given back to
     * HardwareKeyProvider::load of the same provider to restore the handle
     */
    virtual Bytes blob() const = 0;
  };

  /**
   * @class HardwareKeyProvider owns P-256 private keys bound to a root of
   * trust; private scalars never leave it
   */
  class HardwareKeyProvider {
   public:
    virtual ~HardwareKeyProvider() = default;

    /// true when the root of trust is present
    virtual bool isAvailable() const = 0;

    /**
     * Generates a new private key
     * @return handle of the key or SecureCommError::HARDWARE_UNAVAILABLE
     */
    virtual outcome::result<std::shared_ptr<const KeyHandle>> generate() = 0;

    /**
     * Restores a key handle from its blob
     * @param blob - value previously returned by KeyHandle::blob()
     * @return handle or KeyGeneratorError::INVALID_KEY_BLOB
     */
    virtual outcome::result<std::shared_ptr<const KeyHandle>> load(
        BytesIn blob) = 0;

    /**
     * @return public point of the key
     */
    virtual outcome::result<PublicKey> publicKeyOf(
        const KeyHandle &handle) const = 0;

    /**
     * Elliptic-curve Diffie-Hellman of the private key and a peer point
     * @return X coordinate of the resulting point, 32 bytes
     */
    virtual outcome::result<Bytes> deriveSharedSecret(
        const KeyHandle &handle, const PublicKey &peer) const = 0;
  };

}  // namespace securecomm::crypto
