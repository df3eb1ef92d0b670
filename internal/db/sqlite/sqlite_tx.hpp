#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace jobq::db::sqlite {

/*
  SQLite transaction wrapper.

  Write transactions use BEGIN IMMEDIATE:
    - grabs the write lock early
    - a claim's SELECT and UPDATE can't be split by another writer
  Read transactions use BEGIN DEFERRED and never block the writer under WAL.
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Mode { kWrite, kRead };

  SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
};

}
