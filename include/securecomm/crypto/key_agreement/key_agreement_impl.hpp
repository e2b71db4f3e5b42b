/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <securecomm/crypto/hardware_key_provider.hpp>
#include <securecomm/crypto/key_agreement.hpp>
#include <securecomm/crypto/key_marshaller.hpp>
#include <securecomm/log/logger.hpp>
#include <securecomm/storage/key_storage.hpp>

namespace securecomm::crypto {

  class KeyAgreementImpl : public KeyAgreement {
   public:
    struct Slot;

    KeyAgreementImpl(std::shared_ptr<HardwareKeyProvider> provider,
                     std::shared_ptr<storage::KeyStorage> storage,
                     std::shared_ptr<marshaller::KeyMarshaller> marshaller,
                     Config config);

    outcome::result<Bytes> localPublicKey(
        PublicKeyEncoding encoding) const override;

    outcome::result<PublicKey> parsePublicKey(
        BytesIn key_bytes, PublicKeyEncoding encoding) const override;

    outcome::result<SymmetricKey> deriveSymmetricKey(
        const PublicKey &peer, BytesIn salt) const override;

    outcome::result<void> deleteLocalKey() override;

    KeyState keyState() const override;

    /// number of tags with at least one live instance in this process
    static size_t trackedKeyTags();

   private:
    /// loads the key from storage, creating it when it doesn't exist
    outcome::result<std::shared_ptr<const KeyHandle>> localKey() const;

    outcome::result<std::shared_ptr<const KeyHandle>> loadKey(
        BytesIn blob) const;

    outcome::result<std::shared_ptr<const KeyHandle>> createKey() const;

    std::shared_ptr<HardwareKeyProvider> provider_;
    std::shared_ptr<storage::KeyStorage> storage_;
    std::shared_ptr<marshaller::KeyMarshaller> marshaller_;
    Config config_;
    std::shared_ptr<Slot> slot_;
    log::Logger log_;
  };

}  // namespace securecomm::crypto
