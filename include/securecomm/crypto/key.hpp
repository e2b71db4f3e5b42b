/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>

#include <openssl/crypto.h>

#include <securecomm/common/types.hpp>
#include <securecomm/outcome/outcome.hpp>

namespace securecomm::crypto {

  /// P-256 field element size
  constexpr size_t kP256CoordinateSize = 32;
  /// X || Y
  constexpr size_t kP256RawPublicKeySize = 2 * kP256CoordinateSize;
  /// 0x04 || X || Y
  constexpr size_t kP256X963PublicKeySize = 1 + kP256RawPublicKeySize;
  /// SubjectPublicKeyInfo header (26 bytes) followed by an uncompressed point
  constexpr size_t kP256DerPublicKeySize = 26 + kP256X963PublicKeySize;
  /// X9.63 prefix of an uncompressed point
  constexpr uint8_t kUncompressedPointPrefix = 0x04;

  constexpr size_t kSymmetricKeySize = 32;

  /**
   * @struct PublicKey is a validated point of the P-256 curve kept in its
   * uncompressed X9.63 form, so two keys are equal iff their points are equal
   * regardless of the encoding they were parsed from
   */
  struct PublicKey {
    std::array<uint8_t, kP256X963PublicKeySize> point{};

    bool operator==(const PublicKey &other) const = default;
  };

  /**
   * @class SymmetricKey holds 32 bytes of derived key material and wipes them
   * on destruction
   */
  class SymmetricKey {
   public:
    using Data = std::array<uint8_t, kSymmetricKeySize>;

    SymmetricKey() = default;

    explicit SymmetricKey(const Data &data) : data_{data} {}

    SymmetricKey(const SymmetricKey &) = default;
    SymmetricKey(SymmetricKey &&) noexcept = default;
    SymmetricKey &operator=(const SymmetricKey &) = default;
    SymmetricKey &operator=(SymmetricKey &&) noexcept = default;

    ~SymmetricKey() {
      OPENSSL_cleanse(data_.data(), data_.size());
    }

    /**
     * Creates a key from exactly kSymmetricKeySize bytes
     * @return key or OpenSslError::WRONG_KEY_SIZE
     */
    static outcome::result<SymmetricKey> fromBytes(BytesIn bytes);

    BytesIn data() const {
      return data_;
    }

    bool operator==(const SymmetricKey &other) const = default;

   private:
    Data data_{};
  };

  /// HMAC-SHA512 output
  using AuthenticationCode = securecomm::common::Hash512;

}  // namespace securecomm::crypto
