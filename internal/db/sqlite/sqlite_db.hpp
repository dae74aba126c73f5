#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace fleet::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
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

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Configure PRAGMAs (WAL, full sync, busy timeout)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Prepared statement, finalized on scope exit.

  Prepare failures are reported through ok()/rc() so repositories can
  translate them into db::Result instead of throwing.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const {
    return stmt_ != nullptr;
  }

  int rc() const {
    return rc_;
  }

  sqlite3_stmt* get() const {
    return stmt_;
  }

  void BindText(int idx, const std::string& s);
  void BindU64(int idx, std::uint64_t v);
  void BindI64(int idx, std::int64_t v);

  // sqlite3_step; remembers the code for rc()
  int Step();

  std::string   ColText(int col) const;
  std::uint64_t ColU64(int col) const;
  std::int64_t  ColI64(int col) const;

 private:
  sqlite3_stmt* stmt_ = nullptr;
  int           rc_   = SQLITE_OK;
};

} // namespace fleet::db::sqlite
