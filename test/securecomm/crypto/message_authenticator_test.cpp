/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/crypto/message_authenticator/message_authenticator_impl.hpp>

#include <gtest/gtest.h>
#include <securecomm/common/literals.hpp>
#include <securecomm/crypto/hmac_provider/hmac_provider_impl.hpp>
#include "testutil/outcome.hpp"
#include "testutil/p256_vectors.hpp"
#include "testutil/prepare_loggers.hpp"

using securecomm::Bytes;
using securecomm::common::operator""_v;
using securecomm::crypto::MessageAuthenticatorImpl;
using securecomm::crypto::SymmetricKey;
using securecomm::crypto::hmac::HmacProviderImpl;

class MessageAuthenticatorTest : public testing::Test {
 public:
  void SetUp() override {
    testutil::prepareLoggers();
  }

  MessageAuthenticatorImpl authenticator{std::make_shared<HmacProviderImpl>()};
  SymmetricKey key =
      SymmetricKey::fromBytes(testutil::p256::kUnitTestSaltKey).value();
  Bytes message = "hello"_v;
};

/**
 * @given a known key and message
 * @when the authentication code is computed
 * @then it equals the reference HMAC-SHA512
 */
TEST_F(MessageAuthenticatorTest, ComputeKnownCode) {
  EXPECT_OUTCOME_TRUE(code, authenticator.computeCode(message, key));
  ASSERT_EQ(Bytes(code.begin(), code.end()), testutil::p256::kHelloCode);
}

/**
 * @given a code of "hello"
 * @when it is verified against the original and a changed message
 * @then only the original message is accepted
 */
TEST_F(MessageAuthenticatorTest, VerifyDetectsChangedMessage) {
  EXPECT_OUTCOME_TRUE(code, authenticator.computeCode(message, key));
  ASSERT_TRUE(authenticator.verifyCode(code, message, key));
  ASSERT_FALSE(authenticator.verifyCode(code, "hell"_v, key));
  ASSERT_FALSE(authenticator.verifyCode(code, "hello!"_v, key));
  ASSERT_FALSE(authenticator.verifyCode(code, Bytes{}, key));
}

/**
 * @given a code computed under one key
 * @when it is verified under another key
 * @then verification fails
 */
TEST_F(MessageAuthenticatorTest, VerifyDetectsWrongKey) {
  EXPECT_OUTCOME_TRUE(code, authenticator.computeCode(message, key));
  auto other_key = SymmetricKey::fromBytes(Bytes(32, 0x01)).value();
  ASSERT_FALSE(authenticator.verifyCode(code, message, other_key));
}

/**
 * @given codes of a wrong length or with a flipped bit
 * @when they are verified
 * @then verification fails
 */
TEST_F(MessageAuthenticatorTest, VerifyRejectsBadCode) {
  ASSERT_FALSE(authenticator.verifyCode(Bytes{}, message, key));
  auto truncated = Bytes(testutil::p256::kHelloCode.begin(),
                         testutil::p256::kHelloCode.begin() + 32);
  ASSERT_FALSE(authenticator.verifyCode(truncated, message, key));
  auto flipped = testutil::p256::kHelloCode;
  flipped[10] ^= 0x80;
  ASSERT_FALSE(authenticator.verifyCode(flipped, message, key));
  ASSERT_TRUE(
      authenticator.verifyCode(testutil::p256::kHelloCode, message, key));
}

/**
 * @given an empty message
 * @then its code is computed and verified
 */
TEST_F(MessageAuthenticatorTest, EmptyMessage) {
  EXPECT_OUTCOME_TRUE(code, authenticator.computeCode(Bytes{}, key));
  ASSERT_TRUE(authenticator.verifyCode(code, Bytes{}, key));
  ASSERT_FALSE(authenticator.verifyCode(code, message, key));
}
