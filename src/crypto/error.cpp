/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/crypto/error.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(securecomm::crypto, SecureCommError, e) {
  using securecomm::crypto::SecureCommError;
  switch (e) {
    case SecureCommError::HARDWARE_UNAVAILABLE:
      return "hardware root of trust is not available";
    case SecureCommError::STORAGE_FAILURE:
      return "failed to access persisted key material";
    case SecureCommError::MALFORMED_KEY:
      return "public key is malformed";
    case SecureCommError::AUTHENTICATION_FAILED:
      return "authentication failed";
    case SecureCommError::ENCODING_FAILURE:
      return "invalid text encoding";
  }
  return "unknown SecureCommError code";
}

OUTCOME_CPP_DEFINE_CATEGORY(securecomm::crypto, OpenSslError, e) {
  using securecomm::crypto::OpenSslError;
  switch (e) {
    case OpenSslError::FAILED_INITIALIZE_CONTEXT:
      return "failed to initialize context";
    case OpenSslError::FAILED_INITIALIZE_OPERATION:
      return "failed to initialize operation";
    case OpenSslError::FAILED_ENCRYPT_UPDATE:
      return "failed to update encryption";
    case OpenSslError::FAILED_DECRYPT_UPDATE:
      return "failed to update decryption";
    case OpenSslError::FAILED_ENCRYPT_FINALIZE:
      return "failed to finalize encryption";
    case OpenSslError::FAILED_DECRYPT_FINALIZE:
      return "failed to finalize decryption";
    case OpenSslError::WRONG_IV_SIZE:
      return "wrong iv size";
    case OpenSslError::WRONG_KEY_SIZE:
      return "wrong key size";
  }
  return "unknown OpenSslError code";
}

OUTCOME_CPP_DEFINE_CATEGORY(securecomm::crypto, HmacProviderError, e) {
  using securecomm::crypto::HmacProviderError;
  switch (e) {
    case HmacProviderError::UNSUPPORTED_HASH_METHOD:
      return "hash method id provided is not supported";
    case HmacProviderError::FAILED_CREATE_CONTEXT:
      return "failed to create context";
    case HmacProviderError::FAILED_INITIALIZE_CONTEXT:
      return "failed to initialize context";
    case HmacProviderError::FAILED_UPDATE_DIGEST:
      return "failed to update digest";
    case HmacProviderError::FAILED_FINALIZE_DIGEST:
      return "failed to finalize digest";
    case HmacProviderError::WRONG_DIGEST_SIZE:
      return "wrong digest size";
  }
  return "unknown HmacProviderError code";
}

OUTCOME_CPP_DEFINE_CATEGORY(securecomm::crypto, HkdfError, e) {
  using securecomm::crypto::HkdfError;
  switch (e) {
    case HkdfError::OUTPUT_TOO_LONG:
      return "HKDF output may not exceed 255 hash lengths";
  }
  return "unknown HkdfError code";
}

OUTCOME_CPP_DEFINE_CATEGORY(securecomm::crypto, KeyGeneratorError, e) {
  using securecomm::crypto::KeyGeneratorError;
  switch (e) {
    case KeyGeneratorError::KEY_GENERATION_FAILED:
      return "key generation failed";
    case KeyGeneratorError::KEY_DERIVATION_FAILED:
      return "failed to derive shared secret";
    case KeyGeneratorError::GET_KEY_BYTES_FAILED:
      return "failed to get key bytes from EC_KEY";
    case KeyGeneratorError::INVALID_KEY_BLOB:
      return "key blob can't be decoded";
    case KeyGeneratorError::INTERNAL_ERROR:
      return "internal error happened";
  }
  return "unknown key generation error";
}
