#include "sqlite_db.hpp"

#include <vector>

#include "internal/util/errors.hpp"

namespace quotecast::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::PersistenceFailure(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::PersistenceFailure("open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::PersistenceFailure(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  // WAL lets the ctl tool read while the daemon holds the write lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite; delivery history cascades on them
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS schedules (id TEXT PRIMARY KEY, is_enabled INTEGER NOT NULL, scheduled_hour INTEGER NOT NULL, scheduled_minute "
      "INTEGER NOT NULL, delivery_method INTEGER NOT NULL, favorites_only INTEGER NOT NULL, categories TEXT NOT NULL DEFAULT '', "
      "exclude_recent_days INTEGER NOT NULL, active_days TEXT NOT NULL DEFAULT '', last_delivered_quote_id TEXT, last_delivery_at_ms INTEGER, "
      "is_default INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS schedules_single_default ON schedules(is_default) WHERE is_default = 1;",
      "CREATE TABLE IF NOT EXISTS delivery_records (id INTEGER PRIMARY KEY AUTOINCREMENT, quote_id TEXT NOT NULL, schedule_id TEXT NOT NULL, "
      "delivered_at_ms INTEGER NOT NULL, FOREIGN KEY(schedule_id) REFERENCES schedules(id) ON DELETE CASCADE);",
      "CREATE INDEX IF NOT EXISTS delivery_records_by_schedule ON delivery_records(schedule_id, delivered_at_ms);",
      "CREATE INDEX IF NOT EXISTS delivery_records_by_time ON delivery_records(delivered_at_ms);",
      "CREATE TABLE IF NOT EXISTS quotes (id TEXT PRIMARY KEY, text TEXT NOT NULL, author TEXT NOT NULL, categories TEXT NOT NULL DEFAULT '', "
      "is_favorite INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS activity_events (id INTEGER PRIMARY KEY AUTOINCREMENT, kind TEXT NOT NULL, occurred_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS activity_events_by_kind ON activity_events(kind, occurred_at_ms);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec(
      "SELECT id,is_enabled,scheduled_hour,scheduled_minute,delivery_method,favorites_only,categories,exclude_recent_days,active_days,"
      "last_delivered_quote_id,last_delivery_at_ms,is_default,created_at_ms,updated_at_ms FROM schedules LIMIT 1;");
  db.Exec("SELECT id,quote_id,schedule_id,delivered_at_ms FROM delivery_records LIMIT 1;");
  db.Exec("SELECT id,text,author,categories,is_favorite FROM quotes LIMIT 1;");
  db.Exec("SELECT id,kind,occurred_at_ms FROM activity_events LIMIT 1;");
}

} // namespace quotecast::db::sqlite
