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

namespace securecomm::crypto::marshaller {

  using common::PublicKeyEncoding;

  /**
   * @class KeyMarshaller provides methods for serializing and deserializing
   * P-256 public keys from/to RAW, X9.63, DER and PEM representations
   */
  class KeyMarshaller {
   public:
    virtual ~KeyMarshaller() = default;

    /**
     * Convert the public key into the requested representation
     * @param key - public key to be marshalled
     * @param encoding - output format
     * @return encoded bytes (PEM text as its ASCII bytes)
     */
    virtual outcome::result<Bytes> marshal(
        const PublicKey &key, PublicKeyEncoding encoding) const = 0;

    /**
     * Validate and decode a public key
     * @param key_bytes - encoded key
     * @param encoding - format of key_bytes
     * @return public key or SecureCommError::MALFORMED_KEY
     */
    virtual outcome::result<PublicKey> unmarshal(
        BytesIn key_bytes, PublicKeyEncoding encoding) const = 0;
  };
}  // namespace securecomm::crypto::marshaller
