#include "sqlite_repository.hpp"

namespace fleet::db::sqlite {

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Outgoing messages
// ------------------------------------------------------------------

Result SqliteRepository::InsertMessage(Transaction& t, const model::MessageRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO outgoing_message(sequence,type,json,created_at_ms) VALUES(?,?,?,?);");
  if (!st.ok()) return Translate(db, st.rc());

  st.BindU64(1, r.sequence);
  st.BindText(2, r.type);
  st.BindText(3, r.json);
  st.BindU64(4, r.created_at_ms);

  int rc = st.Step();
  if ((rc & 0xff) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, "sequence " + std::to_string(r.sequence));
  }
  return Translate(db, rc);
}

std::vector<model::MessageRecord> SqliteRepository::ListMessages(Transaction& t, std::size_t limit) {
  auto* db = TX(t).Handle();

  std::vector<model::MessageRecord> out;
  if (limit == 0) return out;

  Statement st(db, "SELECT sequence,type,json,created_at_ms FROM outgoing_message ORDER BY sequence ASC LIMIT ?;");
  if (!st.ok()) return out;

  st.BindU64(1, limit);

  while (st.Step() == SQLITE_ROW) {
    model::MessageRecord r;
    r.sequence      = st.ColU64(0);
    r.type          = st.ColText(1);
    r.json          = st.ColText(2);
    r.created_at_ms = st.ColU64(3);
    out.push_back(std::move(r));
  }
  return out;
}

std::uint64_t SqliteRepository::CountMessages(Transaction& t) {
  Statement st(TX(t).Handle(), "SELECT COUNT(*) FROM outgoing_message;");
  if (!st.ok() || st.Step() != SQLITE_ROW) return 0;
  return st.ColU64(0);
}

std::optional<std::uint64_t> SqliteRepository::MaxSequence(Transaction& t) {
  Statement st(TX(t).Handle(), "SELECT MAX(sequence) FROM outgoing_message;");
  if (!st.ok() || st.Step() != SQLITE_ROW) return std::nullopt;

  // MAX() over an empty table yields a single NULL row
  if (sqlite3_column_type(st.get(), 0) == SQLITE_NULL) return std::nullopt;
  return st.ColU64(0);
}

Result SqliteRepository::DeleteMessagesUpTo(Transaction& t, std::uint64_t sequence) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM outgoing_message WHERE sequence<=?;");
  if (!st.ok()) return Translate(db, st.rc());

  st.BindU64(1, sequence);
  return Translate(db, st.Step());
}

Result SqliteRepository::DeleteMessagesByType(Transaction& t, const std::string& type, std::uint64_t* deleted) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM outgoing_message WHERE type=?;");
  if (!st.ok()) return Translate(db, st.rc());

  st.BindText(1, type);
  int rc = st.Step();
  if (rc == SQLITE_DONE && deleted) *deleted = static_cast<std::uint64_t>(sqlite3_changes(db));
  return Translate(db, rc);
}

Result SqliteRepository::DeleteAllMessages(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM outgoing_message;");
  if (!st.ok()) return Translate(db, st.rc());
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Operation contexts
// ------------------------------------------------------------------

Result SqliteRepository::UpsertMessageContext(Transaction& t, const model::MessageContextRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO message_context(operation_id,secure_id,message_type,created_at_ms) VALUES(?,?,?,?) "
               "ON CONFLICT(operation_id) DO UPDATE SET "
               "secure_id=excluded.secure_id, message_type=excluded.message_type, created_at_ms=excluded.created_at_ms;");
  if (!st.ok()) return Translate(db, st.rc());

  st.BindI64(1, r.operation_id);
  st.BindText(2, r.secure_id);
  st.BindText(3, r.message_type);
  st.BindU64(4, r.created_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::MessageContextRecord> SqliteRepository::GetMessageContext(Transaction& t, std::int64_t operation_id) {
  Statement st(TX(t).Handle(), "SELECT operation_id,secure_id,message_type,created_at_ms FROM message_context WHERE operation_id=?;");
  if (!st.ok()) return std::nullopt;

  st.BindI64(1, operation_id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::MessageContextRecord r;
  r.operation_id  = st.ColI64(0);
  r.secure_id     = st.ColText(1);
  r.message_type  = st.ColText(2);
  r.created_at_ms = st.ColU64(3);
  return r;
}

Result SqliteRepository::DeleteMessageContext(Transaction& t, std::int64_t operation_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM message_context WHERE operation_id=?;");
  if (!st.ok()) return Translate(db, st.rc());

  st.BindI64(1, operation_id);
  return Translate(db, st.Step());
}

} // namespace fleet::db::sqlite
