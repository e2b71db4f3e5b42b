/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/crypto/common_functions.hpp>

#include <algorithm>

#include <openssl/obj_mac.h>

#include <securecomm/common/final_action.hpp>
#include <securecomm/crypto/error.hpp>

namespace securecomm::crypto {

  outcome::result<PublicKey> PublicKeyFromX963(BytesIn x963) {
    constexpr auto MALFORMED{SecureCommError::MALFORMED_KEY};
    if (x963.size() != kP256X963PublicKeySize
        or x963[0] != kUncompressedPointPrefix) {
      return MALFORMED;
    }

    EC_GROUP *group = EC_GROUP_new_by_curve_name(NID_X9_62_prime256v1);
    if (nullptr == group) {
      return KeyGeneratorError::INTERNAL_ERROR;
    }
    securecomm::common::FinalAction free_group(
        [group] { EC_GROUP_free(group); });

    EC_POINT *point = EC_POINT_new(group);
    if (nullptr == point) {
      return KeyGeneratorError::INTERNAL_ERROR;
    }
    securecomm::common::FinalAction free_point(
        [point] { EC_POINT_free(point); });

    // decoding an uncompressed point fails for coordinates off the curve
    if (1
        != EC_POINT_oct2point(
            group, point, x963.data(), x963.size(), nullptr)) {
      return MALFORMED;
    }
    if (1 == EC_POINT_is_at_infinity(group, point)
        or 1 != EC_POINT_is_on_curve(group, point, nullptr)) {
      return MALFORMED;
    }

    PublicKey key;
    std::copy(x963.begin(), x963.end(), key.point.begin());
    return key;
  }

  outcome::result<std::shared_ptr<EC_KEY>> EcKeyFromPublicKey(
      const PublicKey &public_key) {
    auto FAILED = KeyGeneratorError::INTERNAL_ERROR;

    std::shared_ptr<EC_KEY> key{EC_KEY_new_by_curve_name(NID_X9_62_prime256v1),
                                EC_KEY_free};
    if (nullptr == key) {
      return FAILED;
    }
    EC_KEY_set_asn1_flag(key.get(), OPENSSL_EC_NAMED_CURVE);

    const EC_GROUP *group = EC_KEY_get0_group(key.get());
    EC_POINT *point = EC_POINT_new(group);
    if (nullptr == point) {
      return FAILED;
    }
    securecomm::common::FinalAction free_point(
        [point] { EC_POINT_free(point); });

    if (1
        != EC_POINT_oct2point(group,
                              point,
                              public_key.point.data(),
                              public_key.point.size(),
                              nullptr)) {
      return SecureCommError::MALFORMED_KEY;
    }
    if (1 != EC_KEY_set_public_key(key.get(), point)) {
      return FAILED;
    }
    if (1 != EC_KEY_check_key(key.get())) {
      return SecureCommError::MALFORMED_KEY;
    }
    return key;
  }

  outcome::result<PublicKey> PublicKeyFromEcKey(const EC_KEY &key) {
    const EC_GROUP *group = EC_KEY_get0_group(&key);
    const EC_POINT *point = EC_KEY_get0_public_key(&key);
    if (nullptr == group or nullptr == point) {
      return KeyGeneratorError::GET_KEY_BYTES_FAILED;
    }
    if (EC_GROUP_get_curve_name(group) != NID_X9_62_prime256v1) {
      return SecureCommError::MALFORMED_KEY;
    }

    PublicKey public_key;
    auto written = EC_POINT_point2oct(group,
                                      point,
                                      POINT_CONVERSION_UNCOMPRESSED,
                                      public_key.point.data(),
                                      public_key.point.size(),
                                      nullptr);
    if (written != public_key.point.size()) {
      return KeyGeneratorError::GET_KEY_BYTES_FAILED;
    }
    return public_key;
  }

}  // namespace securecomm::crypto
