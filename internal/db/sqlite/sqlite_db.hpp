#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace roster::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection, one open transaction at a time: SqliteTransaction holds
  TxMutex() for its lifetime.
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

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(bool wal_mode);

  // Create or upgrade the record store schema.
  void Bootstrap();

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }
  int  AppliedVersion() override;
  void RecordVersion(int version) override;

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace roster::db::sqlite
