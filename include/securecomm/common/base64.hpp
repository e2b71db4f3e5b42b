/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <securecomm/common/types.hpp>
#include <securecomm/outcome/outcome.hpp>

namespace securecomm::common::base64 {

  /**
   * @brief standard (RFC 4648) base64 with padding, no line breaks
   * @param bytes to be encoded
   * @return encoded string
   */
  std::string encode(BytesIn bytes);

  /**
   * @brief strict decoding of padded base64 without whitespace
   * @param text to be decoded
   * @return bytes or SecureCommError::ENCODING_FAILURE
   */
  outcome::result<Bytes> decode(std::string_view text);

}  // namespace securecomm::common::base64
