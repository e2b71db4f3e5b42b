/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <securecomm/outcome/outcome.hpp>

namespace securecomm::crypto {
  /// Errors reported to users of the key agreement, AEAD and MAC components
  enum class SecureCommError {
    HARDWARE_UNAVAILABLE = 1,  ///< no hardware root of trust present
    STORAGE_FAILURE,           ///< persisted key material can't be accessed
    MALFORMED_KEY,             ///< public key encoding is invalid
    AUTHENTICATION_FAILED,     ///< AEAD tag or MAC verification failed
    ENCODING_FAILURE,          ///< invalid text or base64 framing
  };

  enum class OpenSslError {
    FAILED_INITIALIZE_CONTEXT = 1,  ///< failed to initialize context
    FAILED_INITIALIZE_OPERATION,    ///< failed to initialize operation
    FAILED_ENCRYPT_UPDATE,          ///< failed to update encryption
    FAILED_DECRYPT_UPDATE,          ///< failed to update decryption
    FAILED_ENCRYPT_FINALIZE,        ///< failed to finalize encryption
    FAILED_DECRYPT_FINALIZE,        ///< failed to finalize decryption
    WRONG_IV_SIZE,                  ///< wrong iv size
    WRONG_KEY_SIZE,                 ///< wrong key size
  };

  enum class HmacProviderError {
    UNSUPPORTED_HASH_METHOD = 1,  ///< hash method id provided is not supported
    FAILED_CREATE_CONTEXT,        ///< failed to create context
    FAILED_INITIALIZE_CONTEXT,    ///< failed to initialize context
    FAILED_UPDATE_DIGEST,         ///< failed to update digest
    FAILED_FINALIZE_DIGEST,       ///< failed to finalize digest
    WRONG_DIGEST_SIZE,            ///< wrong digest size
  };

  enum class HkdfError {
    OUTPUT_TOO_LONG = 1,  ///< more than 255 blocks of output requested
  };

  enum class KeyGeneratorError {
    KEY_GENERATION_FAILED = 1,  ///< key generation failed
    KEY_DERIVATION_FAILED,      ///< failed to derive shared secret
    GET_KEY_BYTES_FAILED,       ///< failed to serialize the key
    INVALID_KEY_BLOB,           ///< stored key blob can't be decoded
    INTERNAL_ERROR,             ///< internal error happened
  };
}  // namespace securecomm::crypto

OUTCOME_HPP_DECLARE_ERROR(securecomm::crypto, SecureCommError)
OUTCOME_HPP_DECLARE_ERROR(securecomm::crypto, OpenSslError)
OUTCOME_HPP_DECLARE_ERROR(securecomm::crypto, HmacProviderError)
OUTCOME_HPP_DECLARE_ERROR(securecomm::crypto, HkdfError)
OUTCOME_HPP_DECLARE_ERROR(securecomm::crypto, KeyGeneratorError)
