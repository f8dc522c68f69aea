#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace repricer::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction; the writer mutex
  serializes them (BEGIN IMMEDIATE cannot nest on one handle).
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Blocks up to the busy timeout; throws when the writer stays busy.
  std::unique_lock<std::timed_mutex> LockWriter();

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

 private:
  sqlite3*                  db_ = nullptr;
  std::string               path_;
  std::timed_mutex          writer_;
  std::chrono::milliseconds busy_timeout_{5000};
};

} // namespace repricer::db::sqlite
