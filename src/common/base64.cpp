/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/common/base64.hpp>

#include <algorithm>

#include <openssl/evp.h>

#include <securecomm/crypto/error.hpp>

namespace securecomm::common::base64 {

  namespace {
    bool isAlphabetChar(char c) {
      return (c >= 'A' and c <= 'Z') or (c >= 'a' and c <= 'z')
          or (c >= '0' and c <= '9') or c == '+' or c == '/';
    }
  }  // namespace

  std::string encode(BytesIn bytes) {
    if (bytes.empty()) {
      return {};
    }
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    auto len = EVP_EncodeBlock(reinterpret_cast<uint8_t *>(out.data()),
                               bytes.data(),
                               static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(len));
    return out;
  }

  outcome::result<Bytes> decode(std::string_view text) {
    using crypto::SecureCommError;
    if (text.empty()) {
      return Bytes{};
    }
    if (text.size() % 4 != 0) {
      return SecureCommError::ENCODING_FAILURE;
    }
    size_t padding = 0;
    if (text.back() == '=') {
      padding = text[text.size() - 2] == '=' ? 2 : 1;
    }
    auto body = text.substr(0, text.size() - padding);
    if (not std::all_of(body.begin(), body.end(), isAlphabetChar)) {
      return SecureCommError::ENCODING_FAILURE;
    }

    Bytes out(3 * (text.size() / 4), 0);
    auto len = EVP_DecodeBlock(out.data(),
                               reinterpret_cast<const uint8_t *>(text.data()),
                               static_cast<int>(text.size()));
    if (len < 0 or static_cast<size_t>(len) < padding) {
      return SecureCommError::ENCODING_FAILURE;
    }
    // EVP_DecodeBlock keeps the zero bytes produced by padding
    out.resize(static_cast<size_t>(len) - padding);
    return out;
  }

}  // namespace securecomm::common::base64
