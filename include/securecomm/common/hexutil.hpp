/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <boost/algorithm/hex.hpp>

#include <securecomm/common/types.hpp>
#include <securecomm/outcome/outcome.hpp>

namespace securecomm::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError { NOT_ENOUGH_INPUT = 1, NON_HEX_INPUT, UNKNOWN };

  /**
   * @brief Converts bytes to lowercase hex representation
   * @param bytes to be converted
   * @return hexstring
   */
  inline std::string hex_lower(BytesIn bytes) noexcept {
    std::string res(bytes.size() * 2, '\x00');
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), res.begin());
    return res;
  }

  /**
   * @brief Converts hex representation to bytes
   * @param hex string, both uppercase and lowercase are accepted
   * @return bytes if input string is hex encoded and has even length
   */
  outcome::result<Bytes> unhex(std::string_view hex);
}  // namespace securecomm::common

OUTCOME_HPP_DECLARE_ERROR(securecomm::common, UnhexError);
