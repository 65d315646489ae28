#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace osforge::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

namespace {

void ExecOn(sqlite3* db, const char* sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db, sql, nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

} // namespace

Statement PrepareOn(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  ThrowIf(sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr), db, "sqlite prepare");
  return Statement(stmt);
}

void CheckOn(sqlite3* db, int rc, const char* what) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) {
    return;
  }
  throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  // reader connections reopen the same file
  if (path_.empty() || path_ == ":memory:") {
    throw std::invalid_argument("sqlite database path must name a file");
  }

  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  for (auto* reader : idle_readers_) {
    sqlite3_close(reader);
  }
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  ExecOn(db_, sql.c_str());
}

Statement SqliteDB::Prepare(const std::string& sql) {
  return PrepareOn(db_, sql);
}

void SqliteDB::Check(int rc, const char* what) const {
  CheckOn(db_, rc, what);
}

// ------------------------------------------------------------------
// Reader pool
// ------------------------------------------------------------------

ReadConnection SqliteDB::Reader() {
  {
    std::lock_guard lock(readers_mutex_);
    if (!idle_readers_.empty()) {
      auto* reader = idle_readers_.back();
      idle_readers_.pop_back();
      return ReadConnection(*this, reader);
    }
  }

  sqlite3* reader = nullptr;
  int      rc     = sqlite3_open_v2(path_.c_str(), &reader, SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = reader ? sqlite3_errmsg(reader) : "sqlite open failed";
    if (reader) sqlite3_close(reader);
    throw std::runtime_error("sqlite open reader " + path_ + ": " + msg);
  }
  rc = sqlite3_busy_timeout(reader, 5000);
  if (rc != SQLITE_OK) {
    sqlite3_close(reader);
    throw std::runtime_error("sqlite reader busy_timeout failed");
  }
  return ReadConnection(*this, reader);
}

void SqliteDB::Release(sqlite3* reader) {
  std::lock_guard lock(readers_mutex_);
  idle_readers_.push_back(reader);
}

ReadConnection::~ReadConnection() {
  if (db_) {
    owner_->Release(db_);
  }
}

ReadSnapshot::ReadSnapshot(const ReadConnection& conn) : conn_(conn) {
  ExecOn(conn_.Handle(), "BEGIN;");
}

ReadSnapshot::~ReadSnapshot() {
  try {
    ExecOn(conn_.Handle(), "COMMIT;");
  } catch (const std::exception& e) {
    OSFORGE_LOG_WARN("sqlite read snapshot release failed", {observability::StringField("error", e.what())});
  }
}

void SqliteDB::Configure() {
  // readers do not block the log appender
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
  Exec("PRAGMA temp_store=MEMORY;");
}

// ------------------------------------------------------------------
// Transaction
// ------------------------------------------------------------------

Transaction::Transaction(SqliteDB& db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
  if (done_) {
    return;
  }
  try {
    db_.Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    OSFORGE_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void Transaction::Commit() {
  db_.Exec("COMMIT;");
  done_ = true;
}

// ------------------------------------------------------------------
// Bind / column helpers
// ------------------------------------------------------------------

void BindText(sqlite3_stmt* stmt, int idx, const std::string& value) {
  sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

void BindInt64(sqlite3_stmt* stmt, int idx, std::int64_t value) {
  sqlite3_bind_int64(stmt, idx, static_cast<sqlite3_int64>(value));
}

std::string ColumnText(sqlite3_stmt* stmt, int col) {
  const unsigned char* text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char*>(text) : "";
}

std::int64_t ColumnInt64(sqlite3_stmt* stmt, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt, col));
}

bool ColumnIsNull(sqlite3_stmt* stmt, int col) {
  return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

} // namespace osforge::db::sqlite
