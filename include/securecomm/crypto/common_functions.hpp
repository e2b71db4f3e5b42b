/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <openssl/ec.h>

#include <securecomm/common/types.hpp>
#include <securecomm/crypto/key.hpp>
#include <securecomm/outcome/outcome.hpp>

namespace securecomm::crypto {

  /**
   * Validates an uncompressed X9.63 point of the P-256 curve
   * @param x963 - 0x04 || X || Y
   * @return public key or SecureCommError::MALFORMED_KEY if the bytes have a
   * wrong length or prefix, or do not describe a finite point of the curve
   */
  outcome::result<PublicKey> PublicKeyFromX963(BytesIn x963);

  /**
   * Initializes EC_KEY structure holding the given public point only
   * @param public_key - validated P-256 point
   * @return shared pointer to EC_KEY with overridden destructor
   */
  outcome::result<std::shared_ptr<EC_KEY>> EcKeyFromPublicKey(
      const PublicKey &public_key);

  /**
   * Extracts the public point of EC_KEY in uncompressed form
   * @param key - P-256 key with public part set
   * @return public key or KeyGeneratorError::GET_KEY_BYTES_FAILED
   */
  outcome::result<PublicKey> PublicKeyFromEcKey(const EC_KEY &key);

}  // namespace securecomm::crypto
