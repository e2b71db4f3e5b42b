/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace securecomm::crypto::common {

  /**
   * Supported hash types
   */
  enum class HashType { SHA1, SHA256, SHA512 };

  /**
   * Supported AEAD constructions, both use a 12-byte nonce and a 16-byte tag
   */
  enum class AeadAlgorithm { AES_GCM, CHACHA20_POLY1305 };

  /**
   * Interchangeable encodings of a P-256 public key
   */
  enum class PublicKeyEncoding {
    RAW,   ///< X || Y, 64 bytes
    X963,  ///< 0x04 || X || Y, 65 bytes
    DER,   ///< SubjectPublicKeyInfo
    PEM,   ///< base64 of DER between BEGIN/END PUBLIC KEY lines
  };

}  // namespace securecomm::crypto::common
