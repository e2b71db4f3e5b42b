/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/crypto/key_agreement/key_agreement_impl.hpp>

#include <condition_variable>
#include <mutex>
#include <unordered_map>

#include <openssl/crypto.h>

#include <securecomm/crypto/error.hpp>
#include <securecomm/crypto/hkdf.hpp>

namespace securecomm::crypto {

  /// Lifecycle of the key stored under one tag, shared by all instances
  struct KeyAgreementImpl::Slot {
    std::mutex mutex;
    std::condition_variable creation_done;
    KeyState state = KeyState::ABSENT;
  };

  namespace {
    struct SlotRegistry {
      std::mutex mutex;
      std::unordered_map<std::string, std::weak_ptr<KeyAgreementImpl::Slot>>
          slots;

      /// drops tags whose last instance is gone, must be called under mutex
      void pruneExpired() {
        std::erase_if(slots,
                      [](const auto &entry) { return entry.second.expired(); });
      }
    };

    SlotRegistry &slotRegistry() {
      static SlotRegistry registry;
      return registry;
    }

    std::shared_ptr<KeyAgreementImpl::Slot> slotForTag(const std::string &tag) {
      auto &registry = slotRegistry();
      std::lock_guard lock{registry.mutex};
      if (auto it = registry.slots.find(tag); it != registry.slots.end()) {
        if (auto slot = it->second.lock()) {
          return slot;
        }
      }
      registry.pruneExpired();
      auto slot = std::make_shared<KeyAgreementImpl::Slot>();
      registry.slots[tag] = slot;
      return slot;
    }

    bool isHardwareUnavailable(const std::error_code &ec) {
      return ec == make_error_code(SecureCommError::HARDWARE_UNAVAILABLE);
    }
  }  // namespace

  KeyAgreementImpl::KeyAgreementImpl(
      std::shared_ptr<HardwareKeyProvider> provider,
      std::shared_ptr<storage::KeyStorage> storage,
      std::shared_ptr<marshaller::KeyMarshaller> marshaller,
      Config config)
      : provider_{std::move(provider)},
        storage_{std::move(storage)},
        marshaller_{std::move(marshaller)},
        config_{std::move(config)},
        slot_{slotForTag(config_.key_tag)},
        log_{log::createLogger("KeyAgreement", "key_agreement")} {}

  size_t KeyAgreementImpl::trackedKeyTags() {
    auto &registry = slotRegistry();
    std::lock_guard lock{registry.mutex};
    registry.pruneExpired();
    return registry.slots.size();
  }

  outcome::result<Bytes> KeyAgreementImpl::localPublicKey(
      PublicKeyEncoding encoding) const {
    OUTCOME_TRY(handle, localKey());
    auto public_key = provider_->publicKeyOf(*handle);
    if (not public_key) {
      log_->error("Can not get public part of the local key: {}",
                  public_key.error());
      if (isHardwareUnavailable(public_key.error())) {
        return public_key.error();
      }
      return SecureCommError::STORAGE_FAILURE;
    }
    return marshaller_->marshal(public_key.value(), encoding);
  }

  outcome::result<PublicKey> KeyAgreementImpl::parsePublicKey(
      BytesIn key_bytes, PublicKeyEncoding encoding) const {
    auto key = marshaller_->unmarshal(key_bytes, encoding);
    if (not key) {
      SL_DEBUG(log_, "Rejected peer public key: {}", key.error());
      return SecureCommError::MALFORMED_KEY;
    }
    return key;
  }

  outcome::result<SymmetricKey> KeyAgreementImpl::deriveSymmetricKey(
      const PublicKey &peer, BytesIn salt) const {
    OUTCOME_TRY(handle, localKey());
    auto shared_secret = provider_->deriveSharedSecret(*handle, peer);
    if (not shared_secret) {
      log_->error("ECDH failed: {}", shared_secret.error());
      return shared_secret.error();
    }
    auto &secret = shared_secret.value();
    auto okm = hkdf(
        common::HashType::SHA512, salt, secret, BytesIn{}, kSymmetricKeySize);
    OPENSSL_cleanse(secret.data(), secret.size());
    if (not okm) {
      log_->error("Key derivation failed: {}", okm.error());
      return okm.error();
    }
    auto key = SymmetricKey::fromBytes(okm.value());
    OPENSSL_cleanse(okm.value().data(), okm.value().size());
    return key;
  }

  outcome::result<void> KeyAgreementImpl::deleteLocalKey() {
    std::unique_lock lock{slot_->mutex};
    slot_->creation_done.wait(
        lock, [this] { return slot_->state != KeyState::CREATING; });
    if (auto res = storage_->remove(config_.key_tag); not res) {
      log_->error("Can not delete key {}: {}", config_.key_tag, res.error());
      return SecureCommError::STORAGE_FAILURE;
    }
    slot_->state = KeyState::ABSENT;
    log_->info("Local key {} deleted", config_.key_tag);
    return outcome::success();
  }

  KeyState KeyAgreementImpl::keyState() const {
    std::lock_guard lock{slot_->mutex};
    return slot_->state;
  }

  outcome::result<std::shared_ptr<const KeyHandle>> KeyAgreementImpl::localKey()
      const {
    if (not provider_->isAvailable()) {
      log_->error("Hardware key provider is not available");
      return SecureCommError::HARDWARE_UNAVAILABLE;
    }

    std::unique_lock lock{slot_->mutex};
    slot_->creation_done.wait(
        lock, [this] { return slot_->state != KeyState::CREATING; });

    auto stored = storage_->get(config_.key_tag);
    if (not stored) {
      log_->error(
          "Can not read key {}: {}", config_.key_tag, stored.error());
      return SecureCommError::STORAGE_FAILURE;
    }
    if (stored.value().has_value()) {
      OUTCOME_TRY(handle, loadKey(*stored.value()));
      slot_->state = KeyState::PRESENT;
      return handle;
    }

    // the key is absent, this thread becomes the only creator
    slot_->state = KeyState::CREATING;
    lock.unlock();
    auto created = createKey();
    lock.lock();
    slot_->state = created ? KeyState::PRESENT : KeyState::ABSENT;
    lock.unlock();
    slot_->creation_done.notify_all();
    return created;
  }

  outcome::result<std::shared_ptr<const KeyHandle>> KeyAgreementImpl::loadKey(
      BytesIn blob) const {
    auto handle = provider_->load(blob);
    if (not handle) {
      log_->error(
          "Can not load stored key {}: {}", config_.key_tag, handle.error());
      if (isHardwareUnavailable(handle.error())) {
        return handle.error();
      }
      return SecureCommError::STORAGE_FAILURE;
    }
    SL_DEBUG(log_, "Loaded key {}", config_.key_tag);
    return handle;
  }

  outcome::result<std::shared_ptr<const KeyHandle>>
  KeyAgreementImpl::createKey() const {
    auto handle = provider_->generate();
    if (not handle) {
      log_->error("Can not generate key: {}", handle.error());
      return SecureCommError::HARDWARE_UNAVAILABLE;
    }
    auto blob = handle.value()->blob();
    auto stored = storage_->put(config_.key_tag, blob);
    OPENSSL_cleanse(blob.data(), blob.size());
    if (not stored) {
      log_->error(
          "Can not store key {}: {}", config_.key_tag, stored.error());
      return SecureCommError::STORAGE_FAILURE;
    }
    log_->info("Created new local key {}", config_.key_tag);
    return handle;
  }

}  // namespace securecomm::crypto
