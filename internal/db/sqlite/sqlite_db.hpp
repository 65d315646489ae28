#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace osforge::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement PrepareOn(sqlite3* db, const std::string& sql);

// Throws std::runtime_error unless rc is one of the success codes.
void CheckOn(sqlite3* db, int rc, const char* what);

class SqliteDB;

/*
  A read-only connection borrowed from SqliteDB's reader pool; returned on
  destruction.
*/
class ReadConnection {
 public:
  ReadConnection(SqliteDB& owner, sqlite3* db) : owner_(&owner), db_(db) {
  }
  ~ReadConnection();

  ReadConnection(ReadConnection&& other) noexcept : owner_(other.owner_), db_(other.db_) {
    other.db_ = nullptr;
  }
  ReadConnection(const ReadConnection&)            = delete;
  ReadConnection& operator=(const ReadConnection&) = delete;
  ReadConnection& operator=(ReadConnection&&)      = delete;

  sqlite3* Handle() const {
    return db_;
  }

  Statement Prepare(const std::string& sql) const {
    return PrepareOn(db_, sql);
  }

  void Check(int rc, const char* what) const {
    CheckOn(db_, rc, what);
  }

 private:
  SqliteDB* owner_;
  sqlite3*  db_;
};

/*
  Thin RAII wrapper around one sqlite3 database file.

  One read-write connection serves every mutation; callers that need
  multi-statement atomicity take WriteLock() and wrap the work in a
  Transaction. Queries borrow a read-only connection through Reader() and
  never touch the write lock; under WAL they see the last committed state
  while a write transaction is open.
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

  // Execute a SQL string (pragmas, schema, transaction control)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Throws std::runtime_error unless rc is one of the success codes.
  void Check(int rc, const char* what) const;

  std::mutex& WriteLock() {
    return write_mutex_;
  }

  // Opens a new read-only connection when none is idle.
  ReadConnection Reader();

 private:
  friend class ReadConnection;

  // WAL, foreign keys, busy timeout.
  void Configure();
  void Release(sqlite3* reader);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  write_mutex_;

  std::mutex            readers_mutex_;
  std::vector<sqlite3*> idle_readers_;
};

/*
  Single read snapshot across several SELECTs on a reader connection.
*/
class ReadSnapshot {
 public:
  explicit ReadSnapshot(const ReadConnection& conn);
  ~ReadSnapshot();

  ReadSnapshot(const ReadSnapshot&)            = delete;
  ReadSnapshot& operator=(const ReadSnapshot&) = delete;

 private:
  const ReadConnection& conn_;
};

/*
  BEGIN IMMEDIATE ... COMMIT scope.

  Grabs the write lock early; rolls back on destruction unless committed.
*/
class Transaction {
 public:
  explicit Transaction(SqliteDB& db);
  ~Transaction();

  Transaction(const Transaction&)            = delete;
  Transaction& operator=(const Transaction&) = delete;

  void Commit();

 private:
  SqliteDB& db_;
  bool      done_ = false;
};

void BindText(sqlite3_stmt* stmt, int idx, const std::string& value);
void BindInt64(sqlite3_stmt* stmt, int idx, std::int64_t value);

std::string  ColumnText(sqlite3_stmt* stmt, int col);
std::int64_t ColumnInt64(sqlite3_stmt* stmt, int col);
bool         ColumnIsNull(sqlite3_stmt* stmt, int col);

} // namespace osforge::db::sqlite
