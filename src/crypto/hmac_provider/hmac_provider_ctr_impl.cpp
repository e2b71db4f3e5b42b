/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/crypto/hmac_provider/hmac_provider_ctr_impl.hpp>

#include <openssl/crypto.h>
#include <securecomm/common/final_action.hpp>
#include <securecomm/crypto/error.hpp>

namespace securecomm::crypto::hmac {

  namespace {
    const EVP_MD *evpMd(HashType hash_type) {
      switch (hash_type) {
        case HashType::SHA1:
          return EVP_sha1();
        case HashType::SHA256:
          return EVP_sha256();
        case HashType::SHA512:
          return EVP_sha512();
      }
      return nullptr;
    }

    /// HMAC_Init_ex treats a null key as "keep the previous one"
    const uint8_t *keyData(const Bytes &key) {
      static const uint8_t kEmptyKey = 0;
      return key.empty() ? &kEmptyKey : key.data();
    }
  }  // namespace

  HmacProviderCtrImpl::HmacProviderCtrImpl(HashType hash_type, BytesIn key)
      : key_(key.begin(), key.end()),
        hash_st_{evpMd(hash_type)},
        hmac_ctx_{nullptr},
        initialized_{false} {
    if (nullptr == hash_st_) {
      return;
    }
    if (nullptr == (hmac_ctx_ = HMAC_CTX_new())) {
      return;
    }
    initialized_ = 1
        == HMAC_Init_ex(hmac_ctx_,
                        keyData(key_),
                        static_cast<int>(key_.size()),
                        hash_st_,
                        nullptr);
  }

  HmacProviderCtrImpl::~HmacProviderCtrImpl() {
    sinkCtx(HmacProviderCtrImpl::digestSize());
    if (nullptr != hmac_ctx_) {
      HMAC_CTX_free(hmac_ctx_);
    }
    OPENSSL_cleanse(key_.data(), key_.size());
  }

  outcome::result<void> HmacProviderCtrImpl::write(BytesIn data) {
    if (not initialized_) {
      return HmacProviderError::FAILED_INITIALIZE_CONTEXT;
    }
    if (1 != HMAC_Update(hmac_ctx_, data.data(), data.size())) {
      return HmacProviderError::FAILED_UPDATE_DIGEST;
    }
    return outcome::success();
  }

  outcome::result<void> HmacProviderCtrImpl::digestOut(BytesOut out) const {
    if (not initialized_) {
      return HmacProviderError::FAILED_INITIALIZE_CONTEXT;
    }
    if (out.size() != digestSize()) {
      return HmacProviderError::WRONG_DIGEST_SIZE;
    }
    HMAC_CTX *ctx_copy = HMAC_CTX_new();
    if (nullptr == ctx_copy) {
      return HmacProviderError::FAILED_CREATE_CONTEXT;
    }
    securecomm::common::FinalAction free_ctx_copy(
        [ctx_copy] { HMAC_CTX_free(ctx_copy); });
    if (1 != HMAC_CTX_copy(ctx_copy, hmac_ctx_)) {
      return HmacProviderError::FAILED_INITIALIZE_CONTEXT;
    }
    unsigned len{0};
    if (1 != HMAC_Final(ctx_copy, out.data(), &len)) {
      return HmacProviderError::FAILED_FINALIZE_DIGEST;
    }
    if (len != digestSize()) {
      return HmacProviderError::WRONG_DIGEST_SIZE;
    }
    return outcome::success();
  }

  outcome::result<void> HmacProviderCtrImpl::reset() {
    if (nullptr == hash_st_) {
      return HmacProviderError::UNSUPPORTED_HASH_METHOD;
    }
    sinkCtx(digestSize());
    if (nullptr == hmac_ctx_ and nullptr == (hmac_ctx_ = HMAC_CTX_new())) {
      return HmacProviderError::FAILED_CREATE_CONTEXT;
    }
    if (1
        != HMAC_Init_ex(hmac_ctx_,
                        keyData(key_),
                        static_cast<int>(key_.size()),
                        hash_st_,
                        nullptr)) {
      return HmacProviderError::FAILED_INITIALIZE_CONTEXT;
    }
    initialized_ = true;
    return outcome::success();
  }

  size_t HmacProviderCtrImpl::digestSize() const {
    if (nullptr != hash_st_) {
      return EVP_MD_size(hash_st_);
    }
    return 0;
  }

  void HmacProviderCtrImpl::sinkCtx(size_t digest_size) {
    // finalize pending state so no intermediate values stay in the context
    if (initialized_) {
      Bytes data(digest_size, 0);
      unsigned len{0};
      HMAC_Final(hmac_ctx_, data.data(), &len);
      OPENSSL_cleanse(data.data(), data.size());
      initialized_ = false;
    }
  }
}  // namespace securecomm::crypto::hmac
