/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/crypto/hardware_key_provider/software_key_provider.hpp>

#include <openssl/ec.h>
#include <openssl/ecdh.h>
#include <openssl/obj_mac.h>

#include <securecomm/crypto/common_functions.hpp>
#include <securecomm/crypto/error.hpp>

namespace securecomm::crypto {

  namespace {
    class SoftwareKeyHandle : public KeyHandle {
     public:
      SoftwareKeyHandle(std::shared_ptr<EC_KEY> key, Bytes der)
          : key_{std::move(key)}, der_{std::move(der)} {}

      ~SoftwareKeyHandle() override {
        OPENSSL_cleanse(der_.data(), der_.size());
      }

      Bytes blob() const override {
        return der_;
      }

      const std::shared_ptr<EC_KEY> &key() const {
        return key_;
      }

     private:
      std::shared_ptr<EC_KEY> key_;
      Bytes der_;
    };

    outcome::result<const SoftwareKeyHandle *> asSoftwareHandle(
        const KeyHandle &handle) {
      const auto *software = dynamic_cast<const SoftwareKeyHandle *>(&handle);
      if (nullptr == software) {
        return KeyGeneratorError::INVALID_KEY_BLOB;
      }
      return software;
    }

    outcome::result<Bytes> privateKeyDer(EC_KEY *key) {
      int der_size = i2d_ECPrivateKey(key, nullptr);
      if (der_size <= 0) {
        return KeyGeneratorError::GET_KEY_BYTES_FAILED;
      }
      Bytes der(static_cast<size_t>(der_size), 0);
      uint8_t *der_ptr = der.data();
      if (i2d_ECPrivateKey(key, &der_ptr) != der_size) {
        return KeyGeneratorError::GET_KEY_BYTES_FAILED;
      }
      return der;
    }
  }  // namespace

  SoftwareKeyProvider::SoftwareKeyProvider()
      : SoftwareKeyProvider(Config{}) {}

  SoftwareKeyProvider::SoftwareKeyProvider(Config config)
      : config_{config},
        log_{log::createLogger("SoftwareKeyProvider", "crypto")} {}

  bool SoftwareKeyProvider::isAvailable() const {
    return config_.available;
  }

  outcome::result<std::shared_ptr<const KeyHandle>>
  SoftwareKeyProvider::generate() {
    if (not isAvailable()) {
      return SecureCommError::HARDWARE_UNAVAILABLE;
    }
    std::shared_ptr<EC_KEY> key{EC_KEY_new_by_curve_name(NID_X9_62_prime256v1),
                                EC_KEY_free};
    if (nullptr == key) {
      log_->error("can not allocate P-256 key");
      return KeyGeneratorError::KEY_GENERATION_FAILED;
    }
    EC_KEY_set_asn1_flag(key.get(), OPENSSL_EC_NAMED_CURVE);
    if (1 != EC_KEY_generate_key(key.get())) {
      log_->error("P-256 key generation failed");
      return KeyGeneratorError::KEY_GENERATION_FAILED;
    }
    OUTCOME_TRY(der, privateKeyDer(key.get()));
    SL_DEBUG(log_, "generated new P-256 key");
    return std::make_shared<const SoftwareKeyHandle>(std::move(key),
                                                     std::move(der));
  }

  outcome::result<std::shared_ptr<const KeyHandle>> SoftwareKeyProvider::load(
      BytesIn blob) {
    if (not isAvailable()) {
      return SecureCommError::HARDWARE_UNAVAILABLE;
    }
    if (blob.empty()) {
      return KeyGeneratorError::INVALID_KEY_BLOB;
    }
    const uint8_t *der_ptr = blob.data();
    std::shared_ptr<EC_KEY> key{
        d2i_ECPrivateKey(nullptr, &der_ptr, static_cast<long>(blob.size())),
        EC_KEY_free};
    if (nullptr == key or der_ptr != blob.data() + blob.size()) {
      log_->error("stored key blob can not be decoded");
      return KeyGeneratorError::INVALID_KEY_BLOB;
    }
    const EC_GROUP *group = EC_KEY_get0_group(key.get());
    if (nullptr == group
        or EC_GROUP_get_curve_name(group) != NID_X9_62_prime256v1
        or 1 != EC_KEY_check_key(key.get())) {
      log_->error("stored key blob is not a valid P-256 key");
      return KeyGeneratorError::INVALID_KEY_BLOB;
    }
    EC_KEY_set_asn1_flag(key.get(), OPENSSL_EC_NAMED_CURVE);
    return std::make_shared<const SoftwareKeyHandle>(
        std::move(key), Bytes(blob.begin(), blob.end()));
  }

  outcome::result<PublicKey> SoftwareKeyProvider::publicKeyOf(
      const KeyHandle &handle) const {
    OUTCOME_TRY(software, asSoftwareHandle(handle));
    return PublicKeyFromEcKey(*software->key());
  }

  outcome::result<Bytes> SoftwareKeyProvider::deriveSharedSecret(
      const KeyHandle &handle, const PublicKey &peer) const {
    if (not isAvailable()) {
      return SecureCommError::HARDWARE_UNAVAILABLE;
    }
    OUTCOME_TRY(software, asSoftwareHandle(handle));
    OUTCOME_TRY(peer_key, EcKeyFromPublicKey(peer));

    Bytes secret(kP256CoordinateSize, 0);
    int secret_size = ECDH_compute_key(secret.data(),
                                       secret.size(),
                                       EC_KEY_get0_public_key(peer_key.get()),
                                       software->key().get(),
                                       nullptr);
    if (secret_size != static_cast<int>(kP256CoordinateSize)) {
      OPENSSL_cleanse(secret.data(), secret.size());
      log_->error("ECDH computation failed");
      return KeyGeneratorError::KEY_DERIVATION_FAILED;
    }
    return secret;
  }

}  // namespace securecomm::crypto
