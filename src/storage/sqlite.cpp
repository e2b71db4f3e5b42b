/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <securecomm/storage/sqlite.hpp>

namespace securecomm::storage {

  SQLite::SQLite(const std::string &db_file)
      : db_(db_file), log_(log::createLogger(kLoggerTag, kLoggerGroup)) {}

  SQLite::~SQLite() {
    // without the following, all the prepared statements
    // might be executed when db_'s destructor is called
    for (auto &st : statements_) {
      st.used(true);
    }
  }

  int SQLite::getErrorCode() const {
    return sqlite3_extended_errcode(db_.connection().get());
  }

  std::string SQLite::getErrorMessage() const {
    const int ec{getErrorCode()};
    return (0 == ec) ? std::string()
                     : std::string(sqlite3_errstr(ec)) + ": "
                           + sqlite3_errmsg(db_.connection().get());
  }

  SQLite::StatementHandle SQLite::createStatement(const std::string &sql) {
    auto handle{statements_.size()};
    statements_.emplace_back(db_ << sql);
    log_->debug("Created prepared statement {}: {}", handle, sql);
    return handle;
  }

  SQLite::database_binder &SQLite::getStatement(
      SQLite::StatementHandle handle) {
    if (handle >= statements_.size()) {
      throw std::invalid_argument("SQLite: statement handle "
                                  + std::to_string(handle)
                                  + " does not exist");
    }
    return statements_[handle];
  }

  int SQLite::countChanges() const {
    return sqlite3_changes(db_.connection().get());
  }

}  // namespace securecomm::storage
