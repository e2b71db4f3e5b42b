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
   * @class MessageAuthenticator binds messages to a symmetric key with
   * HMAC-SHA512; it gives integrity only, no confidentiality
   */
  class MessageAuthenticator {
   public:
    virtual ~MessageAuthenticator() = default;

    /**
     * @param message - data to authenticate
     * @param key - symmetric key
     * @return 64 bytes authentication code
     */
    virtual outcome::result<AuthenticationCode> computeCode(
        BytesIn message, const SymmetricKey &key) const = 0;

    /**
     * Checks the code in constant time
     * @return true iff code is the authentication code of the message
     */
    virtual bool verifyCode(BytesIn code,
                            BytesIn message,
                            const SymmetricKey &key) const = 0;
  };

}  // namespace securecomm::crypto
