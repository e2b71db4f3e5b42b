/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/crypto/aead_cipher/aead_cipher_impl.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <securecomm/common/literals.hpp>
#include <securecomm/crypto/error.hpp>
#include <securecomm/crypto/random_generator/boost_generator.hpp>
#include "mock/securecomm/crypto/random_generator_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using securecomm::Bytes;
using securecomm::common::operator""_unhex;
using securecomm::common::operator""_v;
using securecomm::crypto::AeadAlgorithm;
using securecomm::crypto::AeadCipherImpl;
using securecomm::crypto::SecureCommError;
using securecomm::crypto::SymmetricKey;
using securecomm::crypto::random::BoostRandomGenerator;
using securecomm::crypto::random::CSPRNGMock;
using testing::Return;

namespace {
  SymmetricKey keyOf(const Bytes &bytes) {
    return SymmetricKey::fromBytes(bytes).value();
  }
}  // namespace

/**
 * Known answers of the underlying primitives
 */
class AeadKnownAnswerTest : public testing::Test {
 public:
  void SetUp() override {
    testutil::prepareLoggers();
  }

  std::shared_ptr<CSPRNGMock> random = std::make_shared<CSPRNGMock>();
};

/**
 * @given all-zero key, nonce and 16 bytes plaintext (GCM test case 14, McGrew and Viega)
 * @when the plaintext is encrypted with AES-256-GCM and decrypted back
 * @then ciphertext and tag match the published ones
 */
TEST_F(AeadKnownAnswerTest, AesGcmTestCase14) {
  AeadCipherImpl cipher{AeadAlgorithm::AES_GCM, random};
  auto key = keyOf(Bytes(32, 0));
  Bytes nonce(12, 0);
  Bytes plaintext(16, 0);
  auto expected =
      "cea7403d4d606b6e074ec5d3baf39d18"
      "d0d1c8a799996bf0265b98b5d48ab919"_unhex;

  EXPECT_OUTCOME_TRUE(ciphertext, cipher.encrypt(key, nonce, plaintext, {}));
  ASSERT_EQ(ciphertext, expected);
  EXPECT_OUTCOME_TRUE(decrypted, cipher.decrypt(key, nonce, expected, {}));
  ASSERT_EQ(decrypted, plaintext);
}

/**
 * @given all-zero key and nonce, empty plaintext (GCM test case 13, McGrew and Viega)
 * @when the plaintext is encrypted with AES-256-GCM
 * @then the output is the published tag only
 */
TEST_F(AeadKnownAnswerTest, AesGcmTestCase13EmptyPlaintext) {
  AeadCipherImpl cipher{AeadAlgorithm::AES_GCM, random};
  auto key = keyOf(Bytes(32, 0));
  Bytes nonce(12, 0);

  EXPECT_OUTCOME_TRUE(ciphertext, cipher.encrypt(key, nonce, Bytes{}, {}));
  ASSERT_EQ(ciphertext, "530f8afbc74536b9a963b4f1c4cb738b"_unhex);
}

/**
 * @given the AEAD test vector of RFC 8439 section 2.8.2
 * @when the plaintext is encrypted with ChaCha20-Poly1305 and decrypted back
 * @then ciphertext and tag match the published ones
 */
TEST_F(AeadKnownAnswerTest, ChaChaPolyRfc8439) {
  AeadCipherImpl cipher{AeadAlgorithm::CHACHA20_POLY1305, random};
  auto key = keyOf(
      "808182838485868788898a8b8c8d8e8f909192939495969798999a9b9c9d9e9f"_unhex);
  auto nonce = "070000004041424344454647"_unhex;
  auto aad = "50515253c0c1c2c3c4c5c6c7"_unhex;
  auto plaintext =
      "Ladies and Gentlemen of the class of '99: If I could offer you only "
      "one tip for the future, sunscreen would be it."_v;
  auto expected =
      "d31a8d34648e60db7b86afbc53ef7ec2a4aded51296e08fea9e2b5a736ee62d6"
      "3dbea45e8ca9671282fafb69da92728b1a71de0a9e060b2905d6a5b67ecd3b36"
      "92ddbd7f2d778b8c9803aee328091b58fab324e4fad675945585808b4831d7bc"
      "3ff4def08e4b7a9de576d26586cec64b6116"
      "1ae10b594f09e26a7e902ecbd0600691"_unhex;

  EXPECT_OUTCOME_TRUE(ciphertext, cipher.encrypt(key, nonce, plaintext, aad));
  ASSERT_EQ(ciphertext, expected);
  EXPECT_OUTCOME_TRUE(decrypted, cipher.decrypt(key, nonce, expected, aad));
  ASSERT_EQ(decrypted, plaintext);
}

/**
 * @given ChaCha20-Poly1305 ciphertext bound to some additional data
 * @when it is decrypted with different additional data
 * @then decryption fails
 */
TEST_F(AeadKnownAnswerTest, WrongAadIsRejected) {
  AeadCipherImpl cipher{AeadAlgorithm::CHACHA20_POLY1305, random};
  auto key = keyOf(Bytes(32, 7));
  Bytes nonce(12, 1);
  EXPECT_OUTCOME_TRUE(
      ciphertext, cipher.encrypt(key, nonce, "payload"_v, "header"_v));
  EXPECT_OUTCOME_FALSE_1(cipher.decrypt(key, nonce, ciphertext, "HEADER"_v));
}

/**
 * @given a cipher
 * @when a nonce of a wrong size is given
 * @then WRONG_IV_SIZE is returned
 */
TEST_F(AeadKnownAnswerTest, WrongNonceSize) {
  AeadCipherImpl cipher{AeadAlgorithm::AES_GCM, random};
  auto key = keyOf(Bytes(32, 0));
  EXPECT_EC(cipher.encrypt(key, Bytes(8, 0), "data"_v, {}),
            securecomm::crypto::OpenSslError::WRONG_IV_SIZE);
}

/**
 * @given a cipher with a mocked random generator
 * @when a message is sealed
 * @then the sealed message starts with the generated nonce
 */
TEST_F(AeadKnownAnswerTest, SealPrependsNonce) {
  AeadCipherImpl cipher{AeadAlgorithm::AES_GCM, random};
  auto key = keyOf(Bytes(32, 0));
  Bytes nonce(12, 0);
  EXPECT_CALL(*random, randomBytes(12)).WillOnce(Return(nonce));

  EXPECT_OUTCOME_TRUE(sealed, cipher.seal(Bytes(16, 0), key));
  auto expected =
      "000000000000000000000000"
      "cea7403d4d606b6e074ec5d3baf39d18"
      "d0d1c8a799996bf0265b98b5d48ab919"_unhex;
  ASSERT_EQ(sealed, expected);
}

/**
 * Contract shared by both algorithms
 */
class AeadCipherTest : public testing::TestWithParam<AeadAlgorithm> {
 public:
  void SetUp() override {
    testutil::prepareLoggers();
    cipher = std::make_shared<AeadCipherImpl>(
        GetParam(), std::make_shared<BoostRandomGenerator>());
  }

  std::shared_ptr<AeadCipherImpl> cipher;
  SymmetricKey key = keyOf(
      "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f"_unhex);
  SymmetricKey other_key = keyOf(Bytes(32, 0x55));
  Bytes message = "hello"_v;
};

/**
 * @given a message
 * @when it is sealed and opened with the same key
 * @then the message is restored, the sealed form has nonce and tag around it
 */
TEST_P(AeadCipherTest, RoundTrip) {
  EXPECT_OUTCOME_TRUE(sealed, cipher->seal(message, key));
  ASSERT_EQ(sealed.size(), 12 + message.size() + 16);
  EXPECT_OUTCOME_TRUE(opened, cipher->open(sealed, key));
  ASSERT_EQ(opened, message);
}

/**
 * @given an empty plaintext
 * @when it is sealed and opened
 * @then the sealed message is 28 bytes and opens to the empty plaintext
 */
TEST_P(AeadCipherTest, EmptyPlaintext) {
  EXPECT_OUTCOME_TRUE(sealed, cipher->seal(Bytes{}, key));
  ASSERT_EQ(sealed.size(), 28);
  EXPECT_OUTCOME_TRUE(opened, cipher->open(sealed, key));
  ASSERT_TRUE(opened.empty());
}

/**
 * @given the same message sealed twice
 * @when sealed messages are compared
 * @then they differ because of fresh nonces
 */
TEST_P(AeadCipherTest, FreshNonces) {
  EXPECT_OUTCOME_TRUE(first, cipher->seal(message, key));
  EXPECT_OUTCOME_TRUE(second, cipher->seal(message, key));
  ASSERT_NE(first, second);
}

/**
 * @given a sealed message
 * @when any single bit of nonce, ciphertext or tag is flipped
 * @then opening fails with AUTHENTICATION_FAILED
 */
TEST_P(AeadCipherTest, BitFlipIsDetected) {
  EXPECT_OUTCOME_TRUE(sealed, cipher->seal(message, key));
  for (size_t i = 0; i < sealed.size(); ++i) {
    for (uint8_t bit = 0; bit < 8; ++bit) {
      Bytes tampered = sealed;
      tampered[i] ^= static_cast<uint8_t>(1u << bit);
      EXPECT_EC(cipher->open(tampered, key),
                SecureCommError::AUTHENTICATION_FAILED);
    }
  }
}

/**
 * @given a sealed message
 * @when it is truncated
 * @then opening fails with AUTHENTICATION_FAILED
 */
TEST_P(AeadCipherTest, TruncationIsDetected) {
  EXPECT_OUTCOME_TRUE(sealed, cipher->seal(message, key));
  for (size_t size : {sealed.size() - 1, size_t{28}, size_t{27}, size_t{0}}) {
    Bytes truncated(sealed.begin(), sealed.begin() + size);
    EXPECT_EC(cipher->open(truncated, key),
              SecureCommError::AUTHENTICATION_FAILED);
  }
}

/**
 * @given a sealed message
 * @when it is opened with another key
 * @then opening fails with AUTHENTICATION_FAILED
 */
TEST_P(AeadCipherTest, WrongKeyIsDetected) {
  EXPECT_OUTCOME_TRUE(sealed, cipher->seal(message, key));
  EXPECT_EC(cipher->open(sealed, other_key),
            SecureCommError::AUTHENTICATION_FAILED);
}

/**
 * @given a cipher
 * @when its parameters are requested
 * @then both algorithms use 12 bytes nonces and 16 bytes tags
 */
TEST_P(AeadCipherTest, Parameters) {
  ASSERT_EQ(cipher->nonceSize(), 12);
  ASSERT_EQ(cipher->tagSize(), 16);
  ASSERT_EQ(cipher->algorithm(), GetParam());
}

INSTANTIATE_TEST_SUITE_P(Algorithms,
                         AeadCipherTest,
                         testing::Values(AeadAlgorithm::AES_GCM,
                                         AeadAlgorithm::CHACHA20_POLY1305));

/**
 * @given a message sealed with AES-256-GCM
 * @when it is opened by a ChaCha20-Poly1305 cipher with the same key
 * @then opening fails with AUTHENTICATION_FAILED
 */
TEST(AeadCipherMismatch, AlgorithmsAreNotInterchangeable) {
  testutil::prepareLoggers();
  auto random = std::make_shared<BoostRandomGenerator>();
  AeadCipherImpl aes{AeadAlgorithm::AES_GCM, random};
  AeadCipherImpl chacha{AeadAlgorithm::CHACHA20_POLY1305, random};
  auto key = keyOf(Bytes(32, 0x11));

  EXPECT_OUTCOME_TRUE(sealed, aes.seal("hello"_v, key));
  EXPECT_EC(chacha.open(sealed, key), SecureCommError::AUTHENTICATION_FAILED);
}
