/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>

#include <securecomm/log/logger.hpp>
#include <securecomm/storage/key_storage.hpp>
#include <securecomm/storage/sqlite.hpp>

namespace securecomm::storage {

  /**
   * @class SqliteKeyStorage keeps blobs in table key_blobs(tag, blob) of a
   * SQLite database file, so they survive process restarts
   */
  class SqliteKeyStorage : public KeyStorage {
   public:
    struct Config {
      /// database file path, ":memory:" gives a private in-memory database
      std::string db_file;
    };

    /// @throws sqlite::sqlite_exception if the database can't be opened
    explicit SqliteKeyStorage(const Config &config);

    outcome::result<void> put(const std::string &tag, BytesIn blob) override;

    outcome::result<std::optional<Bytes>> get(
        const std::string &tag) const override;

    outcome::result<void> remove(const std::string &tag) override;

   private:
    /// prepared statements of the wrapper are not reentrant
    mutable std::mutex mutex_;
    std::unique_ptr<SQLite> db_;
    log::Logger log_;

    SQLite::StatementHandle insert_;
    SQLite::StatementHandle select_;
    SQLite::StatementHandle delete_;
  };

}  // namespace securecomm::storage
