/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <openssl/evp.h>
#include <securecomm/crypto/aead_cipher.hpp>
#include <securecomm/crypto/random_generator.hpp>
#include <securecomm/log/logger.hpp>

namespace securecomm::crypto {

  /// AES-256-GCM and ChaCha20-Poly1305 on top of OpenSSL EVP
  class AeadCipherImpl : public AeadCipher {
   public:
    static constexpr size_t kNonceSize = 12;
    static constexpr size_t kTagSize = 16;

    AeadCipherImpl(AeadAlgorithm algorithm,
                   std::shared_ptr<random::CSPRNG> random);

    outcome::result<Bytes> seal(BytesIn plaintext,
                                const SymmetricKey &key) const override;

    outcome::result<Bytes> open(BytesIn sealed,
                                const SymmetricKey &key) const override;

    outcome::result<Bytes> encrypt(const SymmetricKey &key,
                                   BytesIn nonce,
                                   BytesIn plaintext,
                                   BytesIn aad) const override;

    outcome::result<Bytes> decrypt(const SymmetricKey &key,
                                   BytesIn nonce,
                                   BytesIn ciphertext,
                                   BytesIn aad) const override;

    size_t nonceSize() const override;

    size_t tagSize() const override;

    AeadAlgorithm algorithm() const override;

   private:
    outcome::result<void> init(EVP_CIPHER_CTX *ctx,
                               const SymmetricKey &key,
                               BytesIn nonce,
                               bool encrypt) const;

    const AeadAlgorithm algorithm_;
    const EVP_CIPHER *cipher_;
    std::shared_ptr<random::CSPRNG> random_;
    log::Logger log_ = log::createLogger("AeadCipher", "aead");
  };

}  // namespace securecomm::crypto
