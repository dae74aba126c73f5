#pragma once

#include "sqlite_db.hpp"

namespace fleet::db::sqlite {

// Creates tables and indexes if missing. Idempotent.
void BootstrapSchema(SqliteDB& db);

} // namespace fleet::db::sqlite
