/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/common/hexutil.hpp>

#include <gtest/gtest.h>
#include <securecomm/common/literals.hpp>
#include "testutil/outcome.hpp"

using namespace securecomm::common;
using namespace std::string_literals;

/**
 * @given Array of bytes
 * @when hex it
 * @then hex matches expected lowercase encoding
 */
TEST(Common, Hexutil_Hex) {
  auto bin = "00010204081020ff"_unhex;
  ASSERT_EQ(hex_lower(bin), "00010204081020ff"s);
}

/**
 * @given Hexencoded string of even length in mixed case
 * @when unhex
 * @then result matches expected value
 */
TEST(Common, Hexutil_UnhexEven) {
  EXPECT_OUTCOME_TRUE(actual, unhex("00010204081020Ff"));
  ASSERT_EQ(actual, (securecomm::Bytes{0, 1, 2, 4, 8, 0x10, 0x20, 0xff}));
}

/**
 * @given Hexencoded string of odd length
 * @when unhex
 * @then NOT_ENOUGH_INPUT is returned
 */
TEST(Common, Hexutil_UnhexOdd) {
  EXPECT_EC(unhex("0"), UnhexError::NOT_ENOUGH_INPUT);
}

/**
 * @given Hexencoded string with non-hex letter
 * @when unhex
 * @then NON_HEX_INPUT is returned
 */
TEST(Common, Hexutil_UnhexInvalid) {
  EXPECT_EC(unhex("keks"), UnhexError::NON_HEX_INPUT);
}
