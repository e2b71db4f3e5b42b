/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/crypto/aead_cipher/aead_cipher_impl.hpp>

#include <securecomm/common/final_action.hpp>
#include <securecomm/crypto/error.hpp>

namespace securecomm::crypto {

#define IF1(expr, err, result) \
  if (1 != (expr)) {           \
    log_->error((err));        \
    return (result);           \
  }

  namespace {
    const EVP_CIPHER *evpCipher(AeadAlgorithm algorithm) {
      switch (algorithm) {
        case AeadAlgorithm::AES_GCM:
          return EVP_aes_256_gcm();
        case AeadAlgorithm::CHACHA20_POLY1305:
          return EVP_chacha20_poly1305();
      }
      return nullptr;
    }
  }  // namespace

  AeadCipherImpl::AeadCipherImpl(AeadAlgorithm algorithm,
                                 std::shared_ptr<random::CSPRNG> random)
      : algorithm_{algorithm},
        cipher_{evpCipher(algorithm)},
        random_{std::move(random)} {}

  outcome::result<Bytes> AeadCipherImpl::seal(BytesIn plaintext,
                                              const SymmetricKey &key) const {
    auto nonce = random_->randomBytes(kNonceSize);
    OUTCOME_TRY(ciphertext, encrypt(key, nonce, plaintext, {}));

    Bytes sealed;
    sealed.reserve(nonce.size() + ciphertext.size());
    sealed.insert(sealed.end(), nonce.begin(), nonce.end());
    sealed.insert(sealed.end(), ciphertext.begin(), ciphertext.end());
    return sealed;
  }

  outcome::result<Bytes> AeadCipherImpl::open(BytesIn sealed,
                                              const SymmetricKey &key) const {
    if (sealed.size() < kNonceSize + kTagSize) {
      SL_DEBUG(log_, "sealed message of {} bytes is too short", sealed.size());
      return SecureCommError::AUTHENTICATION_FAILED;
    }
    auto plaintext = decrypt(key,
                             sealed.first(kNonceSize),
                             sealed.subspan(kNonceSize),
                             {});
    if (not plaintext) {
      SL_DEBUG(log_, "sealed message rejected: {}", plaintext.error());
      return SecureCommError::AUTHENTICATION_FAILED;
    }
    return plaintext;
  }

  outcome::result<void> AeadCipherImpl::init(EVP_CIPHER_CTX *ctx,
                                             const SymmetricKey &key,
                                             BytesIn nonce,
                                             bool encrypt) const {
    if (nullptr == cipher_) {
      return OpenSslError::FAILED_INITIALIZE_OPERATION;
    }
    if (nonce.size() != kNonceSize) {
      return OpenSslError::WRONG_IV_SIZE;
    }
    const int enc = encrypt ? 1 : 0;
    IF1(EVP_CipherInit_ex(ctx, cipher_, nullptr, nullptr, nullptr, enc),
        "EVP_CipherInit_ex",
        OpenSslError::FAILED_INITIALIZE_OPERATION);
    IF1(EVP_CIPHER_CTX_ctrl(ctx,
                            EVP_CTRL_AEAD_SET_IVLEN,
                            static_cast<int>(nonce.size()),
                            nullptr),
        "EVP_CTRL_AEAD_SET_IVLEN",
        OpenSslError::WRONG_IV_SIZE);
    IF1(EVP_CipherInit_ex(
            ctx, nullptr, nullptr, key.data().data(), nonce.data(), enc),
        "EVP_CipherInit_ex",
        OpenSslError::FAILED_INITIALIZE_OPERATION);
    return outcome::success();
  }

  outcome::result<Bytes> AeadCipherImpl::encrypt(const SymmetricKey &key,
                                                 BytesIn nonce,
                                                 BytesIn plaintext,
                                                 BytesIn aad) const {
    EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
    if (nullptr == ctx) {
      return OpenSslError::FAILED_INITIALIZE_CONTEXT;
    }
    securecomm::common::FinalAction free_ctx(
        [ctx] { EVP_CIPHER_CTX_free(ctx); });
    OUTCOME_TRY(init(ctx, key, nonce, true));

    int len = 0;
    if (not aad.empty()) {
      IF1(EVP_EncryptUpdate(
              ctx, nullptr, &len, aad.data(), static_cast<int>(aad.size())),
          "EVP_EncryptUpdate (aad)",
          OpenSslError::FAILED_ENCRYPT_UPDATE);
    }

    // ciphertext length equals to plaintext length, then 16 bytes of tag
    Bytes result(plaintext.size() + kTagSize, 0);
    int out_size = 0;
    if (not plaintext.empty()) {
      IF1(EVP_EncryptUpdate(ctx,
                            result.data(),
                            &len,
                            plaintext.data(),
                            static_cast<int>(plaintext.size())),
          "EVP_EncryptUpdate",
          OpenSslError::FAILED_ENCRYPT_UPDATE);
      out_size = len;
    }
    IF1(EVP_EncryptFinal_ex(ctx, result.data() + out_size, &len),
        "EVP_EncryptFinal_ex",
        OpenSslError::FAILED_ENCRYPT_FINALIZE);
    out_size += len;

    IF1(EVP_CIPHER_CTX_ctrl(ctx,
                            EVP_CTRL_AEAD_GET_TAG,
                            static_cast<int>(kTagSize),
                            result.data() + out_size),
        "EVP_CTRL_AEAD_GET_TAG",
        OpenSslError::FAILED_ENCRYPT_FINALIZE);
    result.resize(out_size + kTagSize);
    return result;
  }

  outcome::result<Bytes> AeadCipherImpl::decrypt(const SymmetricKey &key,
                                                 BytesIn nonce,
                                                 BytesIn ciphertext,
                                                 BytesIn aad) const {
    if (ciphertext.size() < kTagSize) {
      return OpenSslError::FAILED_DECRYPT_FINALIZE;
    }
    auto body = ciphertext.first(ciphertext.size() - kTagSize);
    auto tag = ciphertext.last(kTagSize);

    EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
    if (nullptr == ctx) {
      return OpenSslError::FAILED_INITIALIZE_CONTEXT;
    }
    securecomm::common::FinalAction free_ctx(
        [ctx] { EVP_CIPHER_CTX_free(ctx); });
    OUTCOME_TRY(init(ctx, key, nonce, false));

    int len = 0;
    if (not aad.empty()) {
      IF1(EVP_DecryptUpdate(
              ctx, nullptr, &len, aad.data(), static_cast<int>(aad.size())),
          "EVP_DecryptUpdate (aad)",
          OpenSslError::FAILED_DECRYPT_UPDATE);
    }

    Bytes result(body.size() + kTagSize, 0);
    int out_size = 0;
    if (not body.empty()) {
      IF1(EVP_DecryptUpdate(ctx,
                            result.data(),
                            &len,
                            body.data(),
                            static_cast<int>(body.size())),
          "EVP_DecryptUpdate",
          OpenSslError::FAILED_DECRYPT_UPDATE);
      out_size = len;
    }

    // the expected tag is an input, OpenSSL doesn't modify it
    Bytes expected_tag(tag.begin(), tag.end());
    IF1(EVP_CIPHER_CTX_ctrl(ctx,
                            EVP_CTRL_AEAD_SET_TAG,
                            static_cast<int>(kTagSize),
                            expected_tag.data()),
        "EVP_CTRL_AEAD_SET_TAG",
        OpenSslError::FAILED_DECRYPT_FINALIZE);

    // tag mismatch is reported by the finalization; plaintext is discarded
    if (1 != EVP_DecryptFinal_ex(ctx, result.data() + out_size, &len)) {
      OPENSSL_cleanse(result.data(), result.size());
      return OpenSslError::FAILED_DECRYPT_FINALIZE;
    }
    out_size += len;
    result.resize(out_size);
    return result;
  }

  size_t AeadCipherImpl::nonceSize() const {
    return kNonceSize;
  }

  size_t AeadCipherImpl::tagSize() const {
    return kTagSize;
  }

  AeadAlgorithm AeadCipherImpl::algorithm() const {
    return algorithm_;
  }

}  // namespace securecomm::crypto
