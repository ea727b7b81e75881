#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace quotecast::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction of the process; tx_mutex()
  serializes them so BEGIN IMMEDIATE never nests on the same handle.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& tx_mutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

/*
  Creates the quotecast tables and indexes when missing, then probes every
  column the repository reads so a stale schema fails at startup.
*/
void BootstrapSchema(SqliteDB& db);

} // namespace quotecast::db::sqlite
