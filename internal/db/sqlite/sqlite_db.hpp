#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace jobq::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection per process is the normal setup; worker processes each open
  their own. Transactions on a shared connection are serialized through
  Mutex() so threads of one process never interleave BEGIN/COMMIT.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& Mutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations). SQLITE_BUSY and
  // SQLITE_LOCKED surface as db::TransactionConflict.
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  int         busy_timeout_ms_;
  std::mutex  tx_mutex_;
};

} // namespace jobq::db::sqlite
