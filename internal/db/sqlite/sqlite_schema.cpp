#include "sqlite_schema.hpp"

namespace fleet::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  db.Exec(R"SQL(
    CREATE TABLE IF NOT EXISTS outgoing_message (
      sequence      INTEGER PRIMARY KEY,
      type          TEXT    NOT NULL,
      json          TEXT    NOT NULL,
      created_at_ms INTEGER NOT NULL
    );

    CREATE INDEX IF NOT EXISTS outgoing_message_type_idx ON outgoing_message(type);

    CREATE TABLE IF NOT EXISTS message_context (
      operation_id  INTEGER PRIMARY KEY,
      secure_id     TEXT    NOT NULL,
      message_type  TEXT    NOT NULL,
      created_at_ms INTEGER NOT NULL
    );
  )SQL");
}

} // namespace fleet::db::sqlite
