/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "securecomm/injector/secure_messaging_injector.hpp"

#include <gtest/gtest.h>

#include <securecomm/common/literals.hpp>
#include <securecomm/crypto/error.hpp>
#include "testutil/outcome.hpp"
#include "testutil/p256_vectors.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace securecomm;
using namespace injector;
using namespace crypto;

using common::operator""_v;

namespace {
  /// components one party needs for the exchange
  struct Party {
    std::shared_ptr<KeyAgreement> key_agreement;
    std::shared_ptr<AeadCipher> cipher;
    std::shared_ptr<MessageAuthenticator> authenticator;
  };

  template <typename Injector>
  Party makeParty(Injector &injector) {
    return Party{
        injector.template create<std::shared_ptr<KeyAgreement>>(),
        injector.template create<std::shared_ptr<AeadCipher>>(),
        injector.template create<std::shared_ptr<MessageAuthenticator>>()};
  }
}  // namespace

/**
 * @when make default injector
 * @then every component is created with default settings
 */
TEST(SecureMessagingInjector, DefaultBuilds) {
  testutil::prepareLoggers();

  auto injector = makeSecureMessagingInjector();

  auto key_agreement = injector.create<std::shared_ptr<KeyAgreement>>();
  ASSERT_NE(key_agreement, nullptr);
  ASSERT_EQ(key_agreement, injector.create<std::shared_ptr<KeyAgreement>>());

  auto cipher = injector.create<std::shared_ptr<AeadCipher>>();
  ASSERT_NE(cipher, nullptr);
  ASSERT_EQ(cipher->algorithm(), AeadAlgorithm::AES_GCM);
  ASSERT_EQ(cipher->nonceSize(), 12u);
  ASSERT_EQ(cipher->tagSize(), 16u);

  auto authenticator = injector.create<std::shared_ptr<MessageAuthenticator>>();
  ASSERT_NE(authenticator, nullptr);

  auto provider = injector.create<std::shared_ptr<HardwareKeyProvider>>();
  ASSERT_TRUE(provider->isAvailable());

  auto messenger = injector.create<std::shared_ptr<SecureMessenger>>();
  ASSERT_NE(messenger, nullptr);
}

/**
 * @given custom algorithm, storage and key provider
 * @when make injector with them
 * @then the overrides are applied
 */
TEST(SecureMessagingInjector, OverridesApply) {
  testutil::prepareLoggers();

  auto key_storage = std::make_shared<storage::InMemoryKeyStorage>();
  auto provider = std::make_shared<SoftwareKeyProvider>(
      SoftwareKeyProvider::Config{false});
  auto injector = makeSecureMessagingInjector(
      useConfig(AeadAlgorithm::CHACHA20_POLY1305),
      useConfig(KeyAgreement::Config{"test.injector.overrides"}),
      useKeyStorage(key_storage),
      useHardwareKeyProvider(provider));

  ASSERT_EQ(injector.create<std::shared_ptr<AeadCipher>>()->algorithm(),
            AeadAlgorithm::CHACHA20_POLY1305);
  ASSERT_EQ(injector.create<std::shared_ptr<HardwareKeyProvider>>(), provider);
  ASSERT_EQ(injector.create<std::shared_ptr<storage::KeyStorage>>(),
            key_storage);

  auto key_agreement = injector.create<std::shared_ptr<KeyAgreement>>();
  EXPECT_EC(key_agreement->localPublicKey(PublicKeyEncoding::X963),
            SecureCommError::HARDWARE_UNAVAILABLE);
}

/**
 * @given two parties built by separate injectors
 * @when they exchange public keys, derive keys with salt "unit-test-salt" and
 * exchange a sealed and an authenticated "hello"
 * @then the receiver opens the message and accepts the code, while a
 * truncated message is rejected
 */
TEST(SecureMessagingInjector, SealedExchange) {
  testutil::prepareLoggers();

  auto alice_injector = makeSecureMessagingInjector(
      useConfig(KeyAgreement::Config{"test.injector.alice"}));
  auto bob_injector = makeSecureMessagingInjector(
      useConfig(KeyAgreement::Config{"test.injector.bob"}));
  auto alice = makeParty(alice_injector);
  auto bob = makeParty(bob_injector);

  EXPECT_OUTCOME_TRUE(alice_raw,
                      alice.key_agreement->localPublicKey(
                          PublicKeyEncoding::RAW));
  EXPECT_OUTCOME_TRUE(bob_der,
                      bob.key_agreement->localPublicKey(
                          PublicKeyEncoding::DER));
  EXPECT_OUTCOME_TRUE(
      alice_key,
      bob.key_agreement->parsePublicKey(alice_raw, PublicKeyEncoding::RAW));
  EXPECT_OUTCOME_TRUE(
      bob_key,
      alice.key_agreement->parsePublicKey(bob_der, PublicKeyEncoding::DER));

  auto salt = "unit-test-salt"_v;
  EXPECT_OUTCOME_TRUE(alice_secret,
                      alice.key_agreement->deriveSymmetricKey(bob_key, salt));
  EXPECT_OUTCOME_TRUE(bob_secret,
                      bob.key_agreement->deriveSymmetricKey(alice_key, salt));
  ASSERT_EQ(alice_secret, bob_secret);

  auto message = "hello"_v;
  EXPECT_OUTCOME_TRUE(sealed, alice.cipher->seal(message, alice_secret));
  ASSERT_EQ(sealed.size(), message.size() + 28);
  EXPECT_OUTCOME_TRUE(opened, bob.cipher->open(sealed, bob_secret));
  ASSERT_EQ(opened, message);

  EXPECT_OUTCOME_TRUE(code,
                      alice.authenticator->computeCode(message, alice_secret));
  ASSERT_TRUE(bob.authenticator->verifyCode(code, message, bob_secret));
  ASSERT_FALSE(bob.authenticator->verifyCode(code, "hell"_v, bob_secret));

  auto other_salt_key =
      alice.key_agreement->deriveSymmetricKey(bob_key, "other-salt"_v);
  ASSERT_TRUE(other_salt_key);
  EXPECT_EC(bob.cipher->open(sealed, other_salt_key.value()),
            SecureCommError::AUTHENTICATION_FAILED);
}

/**
 * @given two messengers built by separate injectors
 * @when Alice seals and authenticates "hello" for Bob
 * @then Bob opens it and accepts the code, until he deletes his local key
 */
TEST(SecureMessagingInjector, MessengerExchange) {
  testutil::prepareLoggers();

  auto alice_injector = makeSecureMessagingInjector(
      useConfig(KeyAgreement::Config{"test.injector.messenger.alice"}));
  auto bob_injector = makeSecureMessagingInjector(
      useConfig(KeyAgreement::Config{"test.injector.messenger.bob"}));
  auto alice_agreement = alice_injector.create<std::shared_ptr<KeyAgreement>>();
  auto bob_agreement = bob_injector.create<std::shared_ptr<KeyAgreement>>();
  auto alice = alice_injector.create<std::shared_ptr<SecureMessenger>>();
  auto bob = bob_injector.create<std::shared_ptr<SecureMessenger>>();

  EXPECT_OUTCOME_TRUE(alice_pem,
                      alice_agreement->localPublicKey(PublicKeyEncoding::PEM));
  EXPECT_OUTCOME_TRUE(bob_pem,
                      bob_agreement->localPublicKey(PublicKeyEncoding::PEM));
  EXPECT_OUTCOME_TRUE(
      alice_key, bob_agreement->parsePublicKey(alice_pem, PublicKeyEncoding::PEM));
  EXPECT_OUTCOME_TRUE(
      bob_key, alice_agreement->parsePublicKey(bob_pem, PublicKeyEncoding::PEM));

  auto salt = "unit-test-salt"_v;
  auto message = "hello"_v;
  EXPECT_OUTCOME_TRUE(sealed, alice->seal(message, bob_key, salt));
  EXPECT_OUTCOME_TRUE(code, alice->computeCode(message, bob_key, salt));
  EXPECT_OUTCOME_TRUE(opened, bob->open(sealed, alice_key, salt));
  ASSERT_EQ(opened, message);
  EXPECT_OUTCOME_TRUE(accepted, bob->verifyCode(code, message, alice_key, salt));
  ASSERT_TRUE(accepted);

  EXPECT_OUTCOME_TRUE_1(bob_agreement->deleteLocalKey());
  EXPECT_EC(bob->open(sealed, alice_key, salt),
            SecureCommError::AUTHENTICATION_FAILED);
}
