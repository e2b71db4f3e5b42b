/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <securecomm/crypto/hardware_key_provider.hpp>
#include <securecomm/log/logger.hpp>

namespace securecomm::crypto {

  /**
   * @class SoftwareKeyProvider keeps P-256 keys in process memory; the blob
   * of its handles is the DER encoded ECPrivateKey, so it is exportable.
   * Suitable for tests and platforms without a root of trust.
   */
  class SoftwareKeyProvider : public HardwareKeyProvider {
   public:
    struct Config {
      /// false emulates a device without a root of trust
      bool available = true;
    };

    SoftwareKeyProvider();

    explicit SoftwareKeyProvider(Config config);

    bool isAvailable() const override;

    outcome::result<std::shared_ptr<const KeyHandle>> generate() override;

    outcome::result<std::shared_ptr<const KeyHandle>> load(
        BytesIn blob) override;

    outcome::result<PublicKey> publicKeyOf(
        const KeyHandle &handle) const override;

    outcome::result<Bytes> deriveSharedSecret(
        const KeyHandle &handle, const PublicKey &peer) const override;

   private:
    Config config_;
    log::Logger log_;
  };

}  // namespace securecomm::crypto
