/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/storage/sqlite_key_storage.hpp>

#include <securecomm/storage/error.hpp>

namespace securecomm::storage {

  SqliteKeyStorage::SqliteKeyStorage(const Config &config)
      : db_{std::make_unique<SQLite>(config.db_file)},
        log_{log::createLogger("SqliteKeyStorage", SQLite::kLoggerGroup)} {
    *db_ << "CREATE TABLE IF NOT EXISTS key_blobs("
            "tag TEXT PRIMARY KEY, blob BLOB NOT NULL);";
    insert_ = db_->createStatement(
        "INSERT OR REPLACE INTO key_blobs(tag, blob) VALUES(?, ?);");
    select_ = db_->createStatement("SELECT blob FROM key_blobs WHERE tag = ?;");
    delete_ = db_->createStatement("DELETE FROM key_blobs WHERE tag = ?;");
  }

  outcome::result<void> SqliteKeyStorage::put(const std::string &tag,
                                              BytesIn blob) {
    std::lock_guard lock{mutex_};
    Bytes data(blob.begin(), blob.end());
    if (db_->execCommand(insert_, tag, data) < 0) {
      log_->error("Can not store blob with tag {}", tag);
      return StorageError::WRITE_FAILED;
    }
    return outcome::success();
  }

  outcome::result<std::optional<Bytes>> SqliteKeyStorage::get(
      const std::string &tag) const {
    std::lock_guard lock{mutex_};
    std::optional<Bytes> result;
    auto sink = [&result](std::vector<uint8_t> blob) {
      result = std::move(blob);
    };
    if (not db_->execQuery(select_, sink, tag)) {
      log_->error("Can not read blob with tag {}", tag);
      return StorageError::READ_FAILED;
    }
    return result;
  }

  outcome::result<void> SqliteKeyStorage::remove(const std::string &tag) {
    std::lock_guard lock{mutex_};
    if (db_->execCommand(delete_, tag) < 0) {
      log_->error("Can not delete blob with tag {}", tag);
      return StorageError::DELETE_FAILED;
    }
    return outcome::success();
  }

}  // namespace securecomm::storage
