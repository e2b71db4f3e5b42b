/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include <sqlite_modern_cpp.h>
#include <securecomm/log/logger.hpp>

namespace securecomm::storage {

  /// C++ handy interface for SQLite based on SQLiteModernCpp
  class SQLite {
   public:
    using StatementHandle = size_t;
    using database_binder = ::sqlite::database_binder;
    static constexpr auto kLoggerTag = "SQLite";
    static constexpr auto kLoggerGroup = "sqlite";

    explicit SQLite(const std::string &db_file);
    ~SQLite();

    template <typename T>
    auto operator<<(const T &t) {
      return (db_ << t);
    }

    /// Reads extended sqlite3 error code
    int getErrorCode() const;

    /// Returns human-readable representation of an error
    std::string getErrorMessage() const;

    /**
     * Store prepared statement
     * @param sql - prepared statement body
     * @return - handle to the statement
     * @throws sqlite::sqlite_exception if the statement can't be compiled
     */
    StatementHandle createStatement(const std::string &sql);

    /**
     * Executes a command from a prepared statement
     * @tparam Args - command arguments' types
     * @param st_handle - statement identifier
     * @param args - command arguments
     * @return number of rows affected, -1 in case of error
     */
    template <typename... Args>
    inline int execCommand(StatementHandle st_handle, const Args &...args) {
      try {
        auto &st = getStatement(st_handle);
        bindArgs(st, args...);
        st.execute();
        return countChanges();
      } catch (const std::invalid_argument &e) {
        log_->error("Invalid statement handle: {}", e.what());
      } catch (const std::runtime_error &e) {
        log_->error("Command execution failed: {} ({})",
                    e.what(),
                    getErrorMessage());
      }
      return -1;
    }

    /**
     * Executes a query from a prepared statement
     * @tparam Sink - query response consumer type
     * @tparam Args - query arguments' types
     * @param st_handle - statement identifier
     * @param sink - query response consumer
     * @param args - query arguments
     * @return true when query was successfully executed, otherwise - false
     */
    template <typename Sink, typename... Args>
    inline bool execQuery(StatementHandle st_handle,
                          Sink &&sink,
                          const Args &...args) {
      try {
        auto &st = getStatement(st_handle);
        bindArgs(st, args...);
        st >> sink;
        return true;
      } catch (const std::invalid_argument &e) {
        log_->error("Invalid statement handle: {}", e.what());
      } catch (const std::runtime_error &e) {
        log_->error(
            "Query execution failed: {} ({})", e.what(), getErrorMessage());
      }
      return false;
    }

   private:
    /// @throws std::invalid_argument for an unknown handle
    database_binder &getStatement(StatementHandle handle);

    inline static database_binder &bindArgs(database_binder &statement) {
      return statement;
    }

    template <typename Arg, typename... Args>
    inline static database_binder &bindArgs(database_binder &statement,
                                            const Arg &arg,
                                            const Args &...args) {
      statement << arg;
      return bindArgs(statement, args...);
    }

    /// Returns the number of rows modified
    int countChanges() const;

    ::sqlite::database db_;
    log::Logger log_;

    std::vector<database_binder> statements_;
  };

}  // namespace securecomm::storage
