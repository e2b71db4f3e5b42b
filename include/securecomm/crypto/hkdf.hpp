/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <securecomm/common/types.hpp>
#include <securecomm/crypto/common.hpp>
#include <securecomm/outcome/outcome.hpp>

namespace securecomm::crypto {

  /**
   * @brief HMAC-based extract-and-expand key derivation (RFC 5869)
   * @param hash_type underlying hash of the HMAC
   * @param salt optional non-secret salt, empty means hash-length zeros
   * @param ikm input keying material
   * @param info context and application specific information
   * @param length number of output bytes, at most 255 * hash length
   * @return output keying material of the requested length
   */
  outcome::result<Bytes> hkdf(common::HashType hash_type,
                              BytesIn salt,
                              BytesIn ikm,
                              BytesIn info,
                              size_t length);

}  // namespace securecomm::crypto
