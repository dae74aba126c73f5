#include "sqlite_tx.hpp"

#include <exception>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fleet::db::sqlite {

using fleet::observability::StringField;

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (const std::exception& e) {
    throw util::StorageError(std::string("cannot begin transaction on ") + db_->Path() + ": " + e.what());
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Rollback failed", {StringField("path", db_->Path()), StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception& e) {
    throw util::StorageError(std::string("commit failed: ") + e.what());
  }
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace fleet::db::sqlite
