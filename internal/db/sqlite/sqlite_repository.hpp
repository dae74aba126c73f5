#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace fleet::db::sqlite {

/*
  SQLite-backed outgoing queue and operation-context table.

  Schema is created by BootstrapSchema() before the repository is used.
*/
class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertMessage(Transaction&, const model::MessageRecord&) override;
  std::vector<model::MessageRecord> ListMessages(Transaction&, std::size_t limit) override;
  std::uint64_t CountMessages(Transaction&) override;
  std::optional<std::uint64_t> MaxSequence(Transaction&) override;
  Result DeleteMessagesUpTo(Transaction&, std::uint64_t sequence) override;
  Result DeleteMessagesByType(Transaction&, const std::string& type, std::uint64_t* deleted) override;
  Result DeleteAllMessages(Transaction&) override;

  Result UpsertMessageContext(Transaction&, const model::MessageContextRecord&) override;
  std::optional<model::MessageContextRecord> GetMessageContext(Transaction&, std::int64_t operation_id) override;
  Result DeleteMessageContext(Transaction&, std::int64_t operation_id) override;

 private:
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace fleet::db::sqlite
