/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <securecomm/crypto/key_marshaller.hpp>

namespace securecomm::crypto::marshaller {

  class KeyMarshallerImpl : public KeyMarshaller {
   public:
    static constexpr std::string_view kPemHeader =
        "-----BEGIN PUBLIC KEY-----";
    static constexpr std::string_view kPemFooter = "-----END PUBLIC KEY-----";
    static constexpr size_t kPemLineLength = 64;

    outcome::result<Bytes> marshal(const PublicKey &key,
                                   PublicKeyEncoding encoding) const override;

    outcome::result<PublicKey> unmarshal(
        BytesIn key_bytes, PublicKeyEncoding encoding) const override;

   private:
    outcome::result<Bytes> marshalDer(const PublicKey &key) const;
    outcome::result<Bytes> marshalPem(const PublicKey &key) const;

    outcome::result<PublicKey> unmarshalRaw(BytesIn key_bytes) const;
    outcome::result<PublicKey> unmarshalDer(BytesIn key_bytes) const;
    outcome::result<PublicKey> unmarshalPem(BytesIn key_bytes) const;
  };

}  // namespace securecomm::crypto::marshaller
