/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include <securecomm/common/types.hpp>
#include <securecomm/outcome/outcome.hpp>

namespace securecomm::storage {

  /**
   * @class KeyStorage persists opaque key blobs addressed by a tag
   */
  class KeyStorage {
   public:
    virtual ~KeyStorage() = default;

    /**
     * Stores the blob, replacing the previous one with the same tag
     * @param tag - blob identifier
     * @param blob - bytes to store
     */
    virtual outcome::result<void> put(const std::string &tag, BytesIn blob) = 0;

    /**
     * @param tag - blob identifier
     * @return stored blob, empty optional when there is no blob with the tag
     */
    virtual outcome::result<std::optional<Bytes>> get(
        const std::string &tag) const = 0;

    /**
     * Removes the blob, absence of the blob is not an error
     * @param tag - blob identifier
     */
    virtual outcome::result<void> remove(const std::string &tag) = 0;
  };

}  // namespace securecomm::storage
