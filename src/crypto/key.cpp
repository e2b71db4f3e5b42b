/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/crypto/key.hpp>

#include <securecomm/crypto/error.hpp>

namespace securecomm::crypto {

  outcome::result<SymmetricKey> SymmetricKey::fromBytes(BytesIn bytes) {
    if (bytes.size() != kSymmetricKeySize) {
      return OpenSslError::WRONG_KEY_SIZE;
    }
    SymmetricKey key;
    std::copy_n(bytes.begin(), key.data_.size(), key.data_.begin());
    return key;
  }

}  // namespace securecomm::crypto
