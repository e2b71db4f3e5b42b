/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <openssl/hmac.h>
#include <securecomm/crypto/hmac_provider.hpp>

namespace securecomm::crypto::hmac {

  class HmacProviderCtrImpl : public HmacProviderCtr {
   public:
    HmacProviderCtrImpl(HashType hash_type, BytesIn key);

    HmacProviderCtrImpl(const HmacProviderCtrImpl &) = delete;
    HmacProviderCtrImpl &operator=(const HmacProviderCtrImpl &) = delete;

    ~HmacProviderCtrImpl() override;

    outcome::result<void> write(BytesIn data) override;

    outcome::result<void> digestOut(BytesOut out) const override;

    outcome::result<void> reset() override;

    size_t digestSize() const override;

   private:
    void sinkCtx(size_t digest_size);

    Bytes key_;
    const EVP_MD *hash_st_;
    HMAC_CTX *hmac_ctx_;
    bool initialized_;
  };

}  // namespace securecomm::crypto::hmac
