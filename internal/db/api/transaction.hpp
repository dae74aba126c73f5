#pragma once

namespace fleet::db {

/*
  Unit of work over the message queue and context tables.

  Every backend guarantees:

  - writes are invisible to other transactions until Commit()
  - Rollback(), or destruction without Commit(), discards them
  - a failed Commit() throws util::StorageError and leaves nothing applied

  SQLite: BEGIN IMMEDIATE on the single connection, one open at a time
  Memory: snapshot copy, writers conflict on commit
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace fleet::db
