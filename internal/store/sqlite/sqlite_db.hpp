#pragma once

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace circulate::store::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection per store instance; processes sharing the file coordinate
  through SQLite's own file locking.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, schema, transaction control)
  void Exec(const std::string& sql);

 private:
  void Configure(std::chrono::milliseconds busy_timeout);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Prepared statement, finalized on destruction.
*/
class Statement {
 public:
  Statement(SqliteDB& db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(int idx, const std::string& s);
  void BindBlob(int idx, const std::string& bytes);
  void BindInt64(int idx, int64_t v);
  void BindNull(int idx);

  // true while a row is available, false when done
  bool Step();

  std::string ColText(int col) const;
  std::string ColBlob(int col) const;
  int64_t     ColInt64(int col) const;
  bool        ColIsNull(int col) const;

 private:
  SqliteDB&     db_;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace circulate::store::sqlite
