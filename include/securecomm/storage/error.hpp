/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <securecomm/outcome/outcome.hpp>

namespace securecomm::storage {

  enum class StorageError {
    WRITE_FAILED = 1,  ///< blob can not be persisted
    READ_FAILED,       ///< persisted blob can not be read
    DELETE_FAILED,     ///< persisted blob can not be removed
  };

}  // namespace securecomm::storage

OUTCOME_HPP_DECLARE_ERROR(securecomm::storage, StorageError)
