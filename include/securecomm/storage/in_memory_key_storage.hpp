/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <unordered_map>

#include <securecomm/storage/key_storage.hpp>

namespace securecomm::storage {

  /// Keeps blobs in process memory, they are lost when the object dies
  class InMemoryKeyStorage : public KeyStorage {
   public:
    outcome::result<void> put(const std::string &tag, BytesIn blob) override;

    outcome::result<std::optional<Bytes>> get(
        const std::string &tag) const override;

    outcome::result<void> remove(const std::string &tag) override;

   private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Bytes> blobs_;
  };

}  // namespace securecomm::storage
