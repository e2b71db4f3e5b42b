/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/storage/in_memory_key_storage.hpp>

namespace securecomm::storage {

  outcome::result<void> InMemoryKeyStorage::put(const std::string &tag,
                                                BytesIn blob) {
    std::lock_guard lock{mutex_};
    blobs_[tag] = Bytes(blob.begin(), blob.end());
    return outcome::success();
  }

  outcome::result<std::optional<Bytes>> InMemoryKeyStorage::get(
      const std::string &tag) const {
    std::lock_guard lock{mutex_};
    auto it = blobs_.find(tag);
    if (it == blobs_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  outcome::result<void> InMemoryKeyStorage::remove(const std::string &tag) {
    std::lock_guard lock{mutex_};
    blobs_.erase(tag);
    return outcome::success();
  }

}  // namespace securecomm::storage
