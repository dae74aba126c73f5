#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace fleet::db::sqlite {

/*
  BEGIN IMMEDIATE transaction on the agent's single connection.

  The write lock is taken up front, so an enqueue never has to upgrade a
  read lock while the exchange is deleting acknowledged rows. Only one
  transaction may be open per connection; a second Begin() throws.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      committed_ = false;
  bool                      finished_  = false;
};

} // namespace fleet::db::sqlite
