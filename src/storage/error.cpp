/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/storage/error.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(securecomm::storage, StorageError, e) {
  using E = securecomm::storage::StorageError;
  switch (e) {
    case E::WRITE_FAILED:
      return "Failed to write key blob to the storage";
    case E::READ_FAILED:
      return "Failed to read key blob from the storage";
    case E::DELETE_FAILED:
      return "Failed to delete key blob from the storage";
  }
  return "unknown";
}
