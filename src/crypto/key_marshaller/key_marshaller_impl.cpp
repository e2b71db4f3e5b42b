/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/crypto/key_marshaller/key_marshaller_impl.hpp>

#include <openssl/x509.h>

#include <securecomm/common/base64.hpp>
#include <securecomm/common/final_action.hpp>
#include <securecomm/crypto/common_functions.hpp>
#include <securecomm/crypto/error.hpp>

namespace securecomm::crypto::marshaller {

  namespace {
    bool isLineBreak(char c) {
      return c == '\n' or c == '\r';
    }

    /// splits text into lines, accepting both LF and CRLF endings
    std::vector<std::string_view> splitLines(std::string_view text) {
      std::vector<std::string_view> lines;
      while (not text.empty()) {
        auto end = text.find('\n');
        auto line = text.substr(0, end);
        if (not line.empty() and line.back() == '\r') {
          line.remove_suffix(1);
        }
        lines.push_back(line);
        if (end == std::string_view::npos) {
          break;
        }
        text.remove_prefix(end + 1);
      }
      return lines;
    }
  }  // namespace

  outcome::result<Bytes> KeyMarshallerImpl::marshal(
      const PublicKey &key, PublicKeyEncoding encoding) const {
    switch (encoding) {
      case PublicKeyEncoding::RAW:
        return Bytes(key.point.begin() + 1, key.point.end());
      case PublicKeyEncoding::X963:
        return Bytes(key.point.begin(), key.point.end());
      case PublicKeyEncoding::DER:
        return marshalDer(key);
      case PublicKeyEncoding::PEM:
        return marshalPem(key);
    }
    return SecureCommError::ENCODING_FAILURE;
  }

  outcome::result<PublicKey> KeyMarshallerImpl::unmarshal(
      BytesIn key_bytes, PublicKeyEncoding encoding) const {
    switch (encoding) {
      case PublicKeyEncoding::RAW:
        return unmarshalRaw(key_bytes);
      case PublicKeyEncoding::X963:
        return PublicKeyFromX963(key_bytes);
      case PublicKeyEncoding::DER:
        return unmarshalDer(key_bytes);
      case PublicKeyEncoding::PEM:
        return unmarshalPem(key_bytes);
    }
    return SecureCommError::MALFORMED_KEY;
  }

  outcome::result<Bytes> KeyMarshallerImpl::marshalDer(
      const PublicKey &key) const {
    OUTCOME_TRY(ec_key, EcKeyFromPublicKey(key));
    int der_size = i2d_EC_PUBKEY(ec_key.get(), nullptr);
    if (der_size <= 0) {
      return KeyGeneratorError::GET_KEY_BYTES_FAILED;
    }
    Bytes der(static_cast<size_t>(der_size), 0);
    uint8_t *der_ptr = der.data();
    if (i2d_EC_PUBKEY(ec_key.get(), &der_ptr) != der_size) {
      return KeyGeneratorError::GET_KEY_BYTES_FAILED;
    }
    return der;
  }

  outcome::result<Bytes> KeyMarshallerImpl::marshalPem(
      const PublicKey &key) const {
    OUTCOME_TRY(der, marshalDer(key));
    auto body = securecomm::common::base64::encode(der);

    std::string pem{kPemHeader};
    pem += '\n';
    for (size_t pos = 0; pos < body.size(); pos += kPemLineLength) {
      pem.append(body, pos, kPemLineLength);
      pem += '\n';
    }
    pem += kPemFooter;
    pem += '\n';
    return Bytes(pem.begin(), pem.end());
  }

  outcome::result<PublicKey> KeyMarshallerImpl::unmarshalRaw(
      BytesIn key_bytes) const {
    if (key_bytes.size() != kP256RawPublicKeySize) {
      return SecureCommError::MALFORMED_KEY;
    }
    Bytes x963;
    x963.reserve(kP256X963PublicKeySize);
    x963.push_back(kUncompressedPointPrefix);
    x963.insert(x963.end(), key_bytes.begin(), key_bytes.end());
    return PublicKeyFromX963(x963);
  }

  outcome::result<PublicKey> KeyMarshallerImpl::unmarshalDer(
      BytesIn key_bytes) const {
    // compressed points and other curves have a different size
    if (key_bytes.size() != kP256DerPublicKeySize) {
      return SecureCommError::MALFORMED_KEY;
    }
    const uint8_t *der_ptr = key_bytes.data();
    EC_KEY *ec_key =
        d2i_EC_PUBKEY(nullptr, &der_ptr, static_cast<long>(key_bytes.size()));
    if (nullptr == ec_key) {
      return SecureCommError::MALFORMED_KEY;
    }
    securecomm::common::FinalAction free_ec_key(
        [ec_key] { EC_KEY_free(ec_key); });

    // trailing garbage after the SubjectPublicKeyInfo is not accepted
    if (der_ptr != key_bytes.data() + key_bytes.size()) {
      return SecureCommError::MALFORMED_KEY;
    }
    auto public_key = PublicKeyFromEcKey(*ec_key);
    if (not public_key) {
      return SecureCommError::MALFORMED_KEY;
    }
    return PublicKeyFromX963(public_key.value().point);
  }

  outcome::result<PublicKey> KeyMarshallerImpl::unmarshalPem(
      BytesIn key_bytes) const {
    std::string_view text{reinterpret_cast<const char *>(key_bytes.data()),
                          key_bytes.size()};
    while (not text.empty() and isLineBreak(text.back())) {
      text.remove_suffix(1);
    }

    auto lines = splitLines(text);
    if (lines.size() < 3 or lines.front() != kPemHeader
        or lines.back() != kPemFooter) {
      return SecureCommError::MALFORMED_KEY;
    }

    std::string body;
    // every body line but the last one is full, none is empty
    const auto last_body_line = lines.size() - 2;
    for (size_t i = 1; i <= last_body_line; ++i) {
      const auto size = lines[i].size();
      if (size == 0 or size > kPemLineLength
          or (i != last_body_line and size != kPemLineLength)) {
        return SecureCommError::MALFORMED_KEY;
      }
      body.append(lines[i]);
    }

    auto der = securecomm::common::base64::decode(body);
    if (not der) {
      return SecureCommError::MALFORMED_KEY;
    }
    return unmarshalDer(der.value());
  }

}  // namespace securecomm::crypto::marshaller
